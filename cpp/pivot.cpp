#include "pivot.hpp"
#include "merge.hpp"
#include "utils.hpp"
#include <algorithm>
#include <functional>
#include <sstream>

// Nearest occupied cell of `row` scanning from one edge decides the move:
// the pivot itself means it can slide into place, anything else blocks it.
static Move pivotCorrection(const Row& row, Tile expected, bool from_right) {
    const int cols = static_cast<int>(row.size());
    for (int step = 0; step < cols; ++step) {
        int c = from_right ? cols - 1 - step : step;
        if (row[c] == EMPTY_TILE) continue;
        if (row[c] == expected) return from_right ? MOVE_RIGHT : MOVE_LEFT;
        return MOVE_UNDO;
    }
    return MOVE_NONE;
}

Move checkPivots(const Board& board) {
    return checkPivots(board, HeuristicConfig());
}

Move checkPivots(const Board& board, const HeuristicConfig& config) {
    validateBoard(board);

    const int rows = static_cast<int>(board.size());
    const int cols = static_cast<int>(board[0].size());

    std::vector<Tile> ranked;
    ranked.reserve(rows * cols);
    for (const Row& row : board) ranked.insert(ranked.end(), row.begin(), row.end());
    std::sort(ranked.begin(), ranked.end(), std::greater<Tile>());

    for (int row = rows - 1; row >= 0; --row) {
        const int k = rows - row - 1;   // snake row, counted from the bottom
        const int rank = k * cols;      // ranking index of the row's pivot
        const Tile expected = ranked[rank];
        if (expected <= config.pivot_threshold) {
            return MOVE_NONE;
        }

        Move move = MOVE_NONE;
        if (k % 2 == 0) {
            // Even snake rows start at the right edge
            bool predecessor_seated = rank == 0 || board[row + 1][cols - 1] == ranked[rank - 1];
            if (board[row][cols - 1] != expected && predecessor_seated) {
                move = pivotCorrection(board[row], expected, true);
            }
        } else {
            bool predecessor_seated = board[row + 1][0] == ranked[rank - 1];
            if (board[row][0] != expected && predecessor_seated) {
                move = pivotCorrection(board[row], expected, false);
            }
        }

        if (move != MOVE_NONE) {
            std::ostringstream oss;
            oss << "pivot " << expected << " out of place in row " << row << ", forcing " << moveName(move);
            logDebug("PIVOT", oss.str());
            return move;
        }
    }
    return MOVE_NONE;
}
