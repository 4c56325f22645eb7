#include <gtest/gtest.h>

#include "pivot.hpp"
#include "merge.hpp"

#include <stdexcept>

TEST(CheckPivots, BelowThresholdIsIgnored) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {64, 1, 1, 2},
    };
    EXPECT_EQ(checkPivots(board), MOVE_NONE);
    EXPECT_EQ(checkPivots(emptyBoard()), MOVE_NONE);
}

TEST(CheckPivots, SlidesLargestTileRight) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {2, 1, 1, 1},
        {1, 1, 128, 1},
    };
    EXPECT_EQ(checkPivots(board), MOVE_RIGHT);
}

TEST(CheckPivots, UndoWhenLargestTileIsBlocked) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {2, 1, 1, 1},
        {1, 128, 1, 4},
    };
    EXPECT_EQ(checkPivots(board), MOVE_UNDO);
}

TEST(CheckPivots, SeatedCornerPasses) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {2, 1, 1, 1},
        {1, 4, 1, 128},
    };
    EXPECT_EQ(checkPivots(board), MOVE_NONE);
}

TEST(CheckPivots, SecondRowPivotSlidesLeft) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {1, 128, 1, 1},
        {256, 512, 1024, 2048},
    };
    EXPECT_EQ(checkPivots(board), MOVE_LEFT);
}

TEST(CheckPivots, SecondRowPivotBlockedIsUndo) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {1, 2, 128, 1},
        {256, 512, 1024, 2048},
    };
    EXPECT_EQ(checkPivots(board), MOVE_UNDO);
}

TEST(CheckPivots, SecondRowWaitsForPredecessor) {
    // Bottom row does not end with the fourth largest value yet
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {1, 256, 1, 1},
        {128, 512, 1024, 2048},
    };
    EXPECT_EQ(checkPivots(board), MOVE_NONE);
}

TEST(CheckPivots, ThirdRowPivotSlidesRight) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 128, 1},
        {2048, 1024, 512, 256},
        {4096, 8192, 16384, 32768},
    };
    EXPECT_EQ(checkPivots(board), MOVE_RIGHT);
}

TEST(CheckPivots, EmptyPivotRowGivesNoCorrection) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {1, 128, 1, 1},
        {1, 1, 1, 1},
    };
    EXPECT_EQ(checkPivots(board), MOVE_NONE);
}

TEST(CheckPivots, ThresholdIsConfigurable) {
    Board board = {
        {1, 1, 1, 1},
        {1, 1, 1, 1},
        {2, 1, 1, 1},
        {1, 1, 32, 1},
    };
    EXPECT_EQ(checkPivots(board), MOVE_NONE);

    HeuristicConfig config;
    config.pivot_threshold = 16;
    EXPECT_EQ(checkPivots(board, config), MOVE_RIGHT);
}

TEST(CheckPivots, RejectsMalformedBoard) {
    EXPECT_THROW(checkPivots(Board{{128, 2}, {2, 2}}), std::invalid_argument);
}
