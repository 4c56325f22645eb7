#include <gtest/gtest.h>

#include "ai.hpp"

#include <stdexcept>
#include <vector>

namespace {

const Board REFERENCE = {
    {2, 2, 2, 1},
    {4, 16, 2, 2},
    {8, 64, 32, 8},
    {32, 128, 512, 16384},
};

} // namespace

TEST(SnakePath, StartsBottomRightAndFolds) {
    std::vector<Tile> expected = {
        16384, 512, 128, 32,
        8, 64, 32, 8,
        2, 2, 16, 4,
        2, 2, 2, 1,
    };
    EXPECT_EQ(snakePath(REFERENCE), expected);
}

TEST(LongestSnake, StopsAtFirstIncrease) {
    std::vector<Tile> snake = longestSnake(REFERENCE);
    EXPECT_EQ(snake, (std::vector<Tile>{16384, 512, 128, 32, 8}));
}

TEST(LongestSnake, WholeBoardWhenNonIncreasing) {
    Board board = {
        {1, 1, 1, 1},
        {2, 2, 4, 8},
        {128, 64, 32, 16},
        {256, 512, 1024, 2048},
    };
    EXPECT_EQ(longestSnake(board).size(), 16u);
}

TEST(PositionalScore, ReferenceFixture) {
    // Snake: 4^14 + 4^9 + 4^7 + 4^5 + 4^3 = 268715072
    // All cells: sum of 3^log2(v) = 4806214
    EXPECT_DOUBLE_EQ(positionalScore(REFERENCE), 273521286.0);
}

TEST(PositionalScore, EmptyBoard) {
    // 16 sentinels in the snake plus 16 in the value term
    EXPECT_DOUBLE_EQ(positionalScore(emptyBoard()), 32.0);
}

TEST(PositionalScore, PrefersCornerTile) {
    Board corner = emptyBoard();
    corner[3][3] = 2;
    Board far_side = emptyBoard();
    far_side[3][0] = 2;
    EXPECT_DOUBLE_EQ(positionalScore(corner), 37.0);
    EXPECT_DOUBLE_EQ(positionalScore(far_side), 21.0);
}

TEST(PositionalScore, UsesConfiguredBases) {
    HeuristicConfig config;
    config.snake_base = 2.0;
    config.value_base = 1.0;
    Board board = emptyBoard();
    board[3][3] = 8;
    // Snake covers every cell: 2^3 + 15, value term: 16 cells of 1
    EXPECT_DOUBLE_EQ(positionalScore(board, config), 39.0);
}

TEST(PositionalScore, RejectsMalformedBoard) {
    EXPECT_THROW(positionalScore(Board(2, Row(2, EMPTY_TILE))), std::invalid_argument);
}
