#include "ai.hpp"
#include "pivot.hpp"
#include "utils.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

std::vector<Tile> snakePath(const Board& board) {
    std::vector<Tile> path;
    const int rows = static_cast<int>(board.size());
    for (int r = rows - 1; r >= 0; --r) {
        const Row& row = board[r];
        if ((rows - 1 - r) % 2 == 0)
            path.insert(path.end(), row.rbegin(), row.rend());
        else
            path.insert(path.end(), row.begin(), row.end());
    }
    return path;
}

std::vector<Tile> longestSnake(const Board& board) {
    std::vector<Tile> path = snakePath(board);
    std::vector<Tile> seq;
    if (path.empty()) return seq;

    Tile last = path[0];
    for (Tile t : path) {
        if (t > last) break;
        seq.push_back(t);
        last = t;
    }
    return seq;
}

double positionalScore(const Board& board) {
    return positionalScore(board, HeuristicConfig());
}

double positionalScore(const Board& board, const HeuristicConfig& config) {
    validateBoard(board);
    double score = 0.0;
    for (Tile t : longestSnake(board))
        score += std::pow(config.snake_base, tileExponent(t));
    for (const Row& row : board)
        for (Tile t : row)
            score += std::pow(config.value_base, tileExponent(t));
    return score;
}

std::vector<Candidate> generateLeaves(const Board& board, int depth) {
    if (depth > MAX_LOOKAHEAD_DEPTH) {
        std::ostringstream oss;
        oss << "Lookahead depth " << depth << " exceeds " << MAX_LOOKAHEAD_DEPTH << ".";
        throw std::invalid_argument(oss.str());
    }

    // levels[i] holds every state reached after i plies
    std::vector<std::vector<Candidate>> levels(1);
    levels[0].push_back(Candidate{board, MOVE_NONE, 0.0});

    for (int ply = 0; ply < depth; ++ply) {
        const std::vector<Candidate>& current = levels.back();
        std::vector<Candidate> next;
        next.reserve(current.size() * 3);
        for (const Candidate& parent : current) {
            for (Move dir : SEARCH_MOVES) {
                Move label = parent.first_move == MOVE_NONE ? dir : parent.first_move;
                next.push_back(Candidate{slideBoard(parent.board, dir), label, 0.0});
            }
        }
        levels.push_back(std::move(next));
    }
    return levels.back();
}

Move nextMove(const Board& board) {
    return nextMove(board, HeuristicConfig());
}

Move nextMove(const Board& board, const HeuristicConfig& config) {
    return nextMove(board, config, [&config](const Board& b) { return positionalScore(b, config); });
}

Move nextMove(const Board& board, const HeuristicConfig& config, const BoardScorer& scorer) {
    validateBoard(board);

    Move priority_move = checkPivots(board, config);
    if (priority_move != MOVE_NONE) {
        return priority_move;
    }

    std::vector<Candidate> leaves = generateLeaves(board, config.lookahead_depth);
    if (leaves.empty() || leaves[0].first_move == MOVE_NONE) {
        logDebug("SEARCH", "no leaves generated, falling back to undo");
        return MOVE_UNDO;
    }

    // Strict comparison keeps the earliest leaf on ties (down, left, right)
    const Candidate* best = nullptr;
    for (Candidate& leaf : leaves) {
        leaf.score = scorer(leaf.board);
        if (best == nullptr || leaf.score > best->score) {
            best = &leaf;
        }
    }

    std::ostringstream oss;
    oss << leaves.size() << " leaves, best score " << best->score << " via " << moveName(best->first_move);
    logDebug("SEARCH", oss.str());
    return best->first_move;
}
