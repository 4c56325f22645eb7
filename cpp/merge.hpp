#ifndef MERGE_HPP
#define MERGE_HPP

#include "game_defs.hpp" // For Board, Tile, Move, BOARD_SIZE, EMPTY_TILE
#include <vector>

// Pretty-printer for the game board
void printBoard(const Board& board);

// Throws std::invalid_argument unless the board is BOARD_SIZE x BOARD_SIZE
// and every cell is EMPTY_TILE or a power of two in [2, MAX_TILE].
void validateBoard(const Board& board);

// Slides and merges every row (left/right) or column (down) towards the
// target edge. Returns a new board; the input is never modified.
// Only MOVE_DOWN, MOVE_LEFT and MOVE_RIGHT are supported, anything else
// throws std::invalid_argument.
Board slideBoard(const Board& board, Move dir);

Board slideLeft(const Board& board);
Board slideRight(const Board& board);
Board slideDown(const Board& board);

// Compacts a single line towards index 0, merges equal neighbours once
// (a merged tile never merges again in the same call), compacts again.
Row slideLine(const Row& line);

// --- Utility functions often needed by AI or game logic ---

// A board with every cell set to EMPTY_TILE
Board emptyBoard();

bool isEmptyBoard(const Board& board);

// Finds the highest tile value currently on the board (EMPTY_TILE if none)
Tile maxTile(const Board& board);

int countEmptyCells(const Board& board);

// log2 of a tile; the sentinel maps to 0
int tileExponent(Tile value);

// Non-sentinel values, sorted ascending
std::vector<Tile> occupiedTiles(const Board& board);

// True when down, left and right all leave the board unchanged
bool isStuck(const Board& board);

#endif // MERGE_HPP
