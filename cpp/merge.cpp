#include "merge.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

// Pretty-printer (tight ASCII), empty cells shown as '.'
void printBoard(const Board& board) {
    for (const Row& row : board) {
        for (Tile t : row) {
            if (t == EMPTY_TILE)
                std::cout << std::setw(6) << '.';
            else
                std::cout << std::setw(6) << t;
        }
        std::cout << '\n';
    }
    std::cout << std::string(BOARD_SIZE * 6, '-') << "\n\n";
}

static bool isPowerOfTwo(Tile value) {
    return value >= 2 && (value & (value - 1)) == 0;
}

void validateBoard(const Board& board) {
    if (board.empty()) {
        throw std::invalid_argument("Board must be a non-empty 2D grid.");
    }
    const size_t cols = board[0].size();
    for (const Row& row : board) {
        if (row.size() != cols) {
            throw std::invalid_argument("All rows must have the same number of columns.");
        }
    }
    if (board.size() != static_cast<size_t>(BOARD_SIZE) || cols != static_cast<size_t>(BOARD_SIZE)) {
        std::ostringstream oss;
        oss << "Board must be " << BOARD_SIZE << "x" << BOARD_SIZE
            << ", got " << board.size() << "x" << cols << ".";
        throw std::invalid_argument(oss.str());
    }
    for (size_t r = 0; r < board.size(); ++r) {
        for (size_t c = 0; c < cols; ++c) {
            Tile t = board[r][c];
            if (t != EMPTY_TILE && (!isPowerOfTwo(t) || t > MAX_TILE)) {
                std::ostringstream oss;
                oss << "Invalid tile value " << t << " at (" << r << "," << c << ").";
                throw std::invalid_argument(oss.str());
            }
        }
    }
}

// Moves every non-sentinel value to the front, keeping order
static Row compactLine(const Row& line) {
    Row out;
    out.reserve(line.size());
    for (Tile t : line) {
        if (t != EMPTY_TILE) out.push_back(t);
    }
    out.resize(line.size(), EMPTY_TILE);
    return out;
}

Row slideLine(const Row& line) {
    Row compacted = compactLine(line);

    // Merge pass from the target edge inward. After a merge the partner slot
    // becomes the sentinel, so the merged tile cannot match again.
    for (size_t i = 0; i + 1 < compacted.size(); ++i) {
        if (compacted[i] != EMPTY_TILE && compacted[i] == compacted[i + 1]) {
            compacted[i] *= 2;
            compacted[i + 1] = EMPTY_TILE;
            ++i;
        }
    }
    return compactLine(compacted);
}

Board slideLeft(const Board& board) {
    Board result = board;
    for (Row& row : result) {
        row = slideLine(row);
    }
    return result;
}

Board slideRight(const Board& board) {
    Board result = board;
    for (Row& row : result) {
        Row reversed(row.rbegin(), row.rend());
        reversed = slideLine(reversed);
        row.assign(reversed.rbegin(), reversed.rend());
    }
    return result;
}

Board slideDown(const Board& board) {
    Board result = board;
    const size_t rows = result.size();
    const size_t cols = rows ? result[0].size() : 0;
    for (size_t c = 0; c < cols; ++c) {
        // Bottom cell first so the target edge is index 0
        Row column;
        column.reserve(rows);
        for (size_t r = rows; r-- > 0;) column.push_back(result[r][c]);
        column = slideLine(column);
        for (size_t i = 0; i < rows; ++i) result[rows - 1 - i][c] = column[i];
    }
    return result;
}

Board slideBoard(const Board& board, Move dir) {
    validateBoard(board);
    switch (dir) {
    case MOVE_DOWN:
        return slideDown(board);
    case MOVE_LEFT:
        return slideLeft(board);
    case MOVE_RIGHT:
        return slideRight(board);
    default:
        // The decision logic never searches upwards; see DESIGN.md.
        throw std::invalid_argument("slideBoard: unsupported direction '" + moveName(dir) + "'");
    }
}

Board emptyBoard() {
    return Board(BOARD_SIZE, Row(BOARD_SIZE, EMPTY_TILE));
}

bool isEmptyBoard(const Board& board) {
    for (const Row& row : board)
        for (Tile t : row)
            if (t != EMPTY_TILE) return false;
    return true;
}

Tile maxTile(const Board& board) {
    Tile max_val = EMPTY_TILE;
    for (const Row& row : board)
        for (Tile t : row)
            max_val = std::max(max_val, t);
    return max_val;
}

int countEmptyCells(const Board& board) {
    int count = 0;
    for (const Row& row : board)
        count += static_cast<int>(std::count(row.begin(), row.end(), EMPTY_TILE));
    return count;
}

int tileExponent(Tile value) {
    int exp = 0;
    while (value > 1) {
        value >>= 1;
        ++exp;
    }
    return exp;
}

std::vector<Tile> occupiedTiles(const Board& board) {
    std::vector<Tile> tiles;
    for (const Row& row : board)
        for (Tile t : row)
            if (t != EMPTY_TILE) tiles.push_back(t);
    std::sort(tiles.begin(), tiles.end());
    return tiles;
}

bool isStuck(const Board& board) {
    return slideDown(board) == board && slideLeft(board) == board && slideRight(board) == board;
}
