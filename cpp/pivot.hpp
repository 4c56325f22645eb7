#ifndef PIVOT_HPP
#define PIVOT_HPP

#include "game_defs.hpp" // For Board, Move, HeuristicConfig

// Checks that the largest tiles sit on the corner-anchored snake: the k-th
// row from the bottom must start (right edge for even k, left edge for odd k)
// with the (k * BOARD_SIZE)-th largest value once the previous row ends with
// its predecessor. Returns MOVE_RIGHT / MOVE_LEFT to slide a misplaced pivot
// into place, MOVE_UNDO when it is trapped behind another tile, and
// MOVE_NONE when nothing above the pivot threshold is out of place.
Move checkPivots(const Board& board);
Move checkPivots(const Board& board, const HeuristicConfig& config);

#endif // PIVOT_HPP
