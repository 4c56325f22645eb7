#ifndef GAME_DEFS_HPP
#define GAME_DEFS_HPP

#include <functional>
#include <vector>

// Define fundamental types for clarity
using Tile = int;
using Row = std::vector<Tile>;   // Each row is a vector of tiles, left to right
using Board = std::vector<Row>;  // The board is a vector of rows, top to bottom

// === Game Configuration ===
const int BOARD_SIZE = 4;        // The board is always BOARD_SIZE x BOARD_SIZE
const Tile EMPTY_TILE = 1;       // Empty-cell sentinel; real tiles are powers of two >= 2
const Tile MAX_TILE = 131072;    // Largest tile a 4x4 game can hold; its double still fits an int
const int LOOKAHEAD_DEPTH = 3;   // Plies simulated by the search
const int MAX_LOOKAHEAD_DEPTH = 8; // The search keeps 3^depth boards
const double SNAKE_SCORE_BASE = 4.0;  // Per-cell base for the monotonic snake prefix
const double VALUE_SCORE_BASE = 3.0;  // Per-cell base for every cell on the board
const Tile PIVOT_THRESHOLD = 64; // Pivots at or below this value are left to the search
const double SPAWN_FOUR_PROBABILITY = 0.1; // Simulated game spawns a 4 instead of a 2
// ==========================

enum Move {
    MOVE_NONE = -1, // "no forced move" result of the pivot check
    MOVE_UP = 0,
    MOVE_DOWN,
    MOVE_LEFT,
    MOVE_RIGHT,
    MOVE_UNDO
};

// Tunable heuristic values. Defaults mirror the constants above.
struct HeuristicConfig {
    double snake_base = SNAKE_SCORE_BASE;
    double value_base = VALUE_SCORE_BASE;
    Tile pivot_threshold = PIVOT_THRESHOLD;
    int lookahead_depth = LOOKAHEAD_DEPTH;
};

// Leaf evaluation used by the search
using BoardScorer = std::function<double(const Board&)>;

// Fire-and-forget external action (key press) emitted by the orchestrator
using KeySink = std::function<void(Move)>;

#endif // GAME_DEFS_HPP
