#pragma once
#include "merge.hpp"
#include <vector>

// Moves the search simulates, in generation order (also the tie-break order)
const Move SEARCH_MOVES[] = {MOVE_DOWN, MOVE_LEFT, MOVE_RIGHT};

// A simulated board tagged with the first move on its path
struct Candidate {
    Board board;
    Move first_move;
    double score;
};

// Every cell once, starting at the bottom-right corner: bottom row right to
// left, next row left to right, and so on.
std::vector<Tile> snakePath(const Board& board);

// Longest non-increasing prefix of snakePath
std::vector<Tile> longestSnake(const Board& board);

// Sum of snake_base^log2(v) over the snake prefix plus value_base^log2(v)
// over every cell.
double positionalScore(const Board& board);
double positionalScore(const Board& board, const HeuristicConfig& config);

// Breadth-first expansion over SEARCH_MOVES, `depth` levels deep. Leaves are
// returned in generation order with score 0. Throws std::invalid_argument
// when depth exceeds MAX_LOOKAHEAD_DEPTH.
std::vector<Candidate> generateLeaves(const Board& board, int depth);

// Pivot check first, then the lookahead search; returns the first move of
// the best scoring leaf (earliest generated wins ties), MOVE_UNDO if there
// are no leaves.
Move nextMove(const Board& board);
Move nextMove(const Board& board, const HeuristicConfig& config);
Move nextMove(const Board& board, const HeuristicConfig& config, const BoardScorer& scorer);
