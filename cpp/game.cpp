#include "game.hpp"
#include <sstream>
#include <stdexcept> // For std::invalid_argument
#include <utility>

// Boards kept for answering undo in the simulated game
static const size_t MAX_UNDO_HISTORY = 16;

Move rotateMove(Move move) {
    switch (move) {
    case MOVE_DOWN: return MOVE_LEFT;
    case MOVE_LEFT: return MOVE_RIGHT;
    default:        return MOVE_DOWN;
    }
}

MoveResult advance(const Board& board, const KeySink& sink) {
    return advance(board, sink, HeuristicConfig());
}

MoveResult advance(const Board& board, const KeySink& sink, const HeuristicConfig& config) {
    Move move = nextMove(board, config);

    if (move == MOVE_UNDO) {
        logDebug("ENGINE", "issuing undo, board reset for a fresh observation");
        if (sink) sink(move);
        return MoveResult{emptyBoard(), move};
    }

    Board upcoming = slideBoard(board, move);
    int tried = 1;
    while (upcoming == board && tried < 3) {
        logDebug("ENGINE", moveName(move) + " is a no-op, rotating");
        move = rotateMove(move);
        upcoming = slideBoard(board, move);
        ++tried;
    }

    logDebug("ENGINE", "move " + moveName(move) + " (key '" + keyForMove(move) + "')");
    if (sink) sink(move);
    return MoveResult{upcoming, move};
}

Game::Game() : Game(std::random_device{}()) {
}

Game::Game(unsigned int seed)
    : rng_engine_(seed), game_over_(false), moves_played_(0), undos_played_(0) {
    reset();
}

void Game::reset() {
    board_ = emptyBoard();
    history_.clear();
    game_over_ = false;
    moves_played_ = 0;
    undos_played_ = 0;
    spawnTile();
    spawnTile();
}

bool Game::spawnTile() {
    std::vector<std::pair<int, int>> empty_cells;
    for (int r = 0; r < BOARD_SIZE; ++r)
        for (int c = 0; c < BOARD_SIZE; ++c)
            if (board_[r][c] == EMPTY_TILE) empty_cells.push_back(std::make_pair(r, c));
    if (empty_cells.empty()) return false;

    std::uniform_int_distribution<size_t> pick(0, empty_cells.size() - 1);
    const std::pair<int, int>& cell = empty_cells[pick(rng_engine_)];
    std::bernoulli_distribution four(SPAWN_FOUR_PROBABILITY);
    board_[cell.first][cell.second] = four(rng_engine_) ? 4 : 2;
    return true;
}

Move Game::step() {
    if (game_over_) return MOVE_NONE;

    MoveResult result = advance(board_, sink_, config_);

    if (result.move == MOVE_UNDO) {
        if (history_.empty()) {
            logDebug("ENGINE", "undo requested with no history, game over");
            game_over_ = true;
            return result.move;
        }
        board_ = history_.back();
        history_.pop_back();
        ++undos_played_;
        return result.move;
    }

    if (result.board == board_) {
        // Every searched direction was a no-op
        game_over_ = true;
        return result.move;
    }

    history_.push_back(board_);
    if (history_.size() > MAX_UNDO_HISTORY) history_.pop_front();
    board_ = result.board;
    spawnTile();
    ++moves_played_;
    game_over_ = isStuck(board_);
    return result.move;
}

std::vector<Tile> Game::get_flat_state() const {
    std::vector<Tile> flat_state;
    flat_state.reserve(BOARD_SIZE * BOARD_SIZE);
    for (const Row& row : board_)
        flat_state.insert(flat_state.end(), row.begin(), row.end());
    return flat_state;
}

const Board& Game::board() const {
    return board_;
}

bool Game::is_game_over() const {
    return game_over_;
}

int Game::moves_played() const {
    return moves_played_;
}

int Game::undos_played() const {
    return undos_played_;
}

void Game::set_config(const HeuristicConfig& config) {
    config_ = config;
}

void Game::set_key_sink(const KeySink& sink) {
    sink_ = sink;
}

void Game::set_board_from_flat(const std::vector<Tile>& flat_board_data) {
    if (flat_board_data.size() != static_cast<size_t>(BOARD_SIZE * BOARD_SIZE)) {
        std::ostringstream oss;
        oss << "Invalid flat board size " << flat_board_data.size()
            << ", expected " << BOARD_SIZE * BOARD_SIZE << ".";
        throw std::invalid_argument(oss.str());
    }

    Board board(BOARD_SIZE, Row(BOARD_SIZE, EMPTY_TILE));
    for (int r = 0; r < BOARD_SIZE; ++r)
        for (int c = 0; c < BOARD_SIZE; ++c)
            board[r][c] = flat_board_data[r * BOARD_SIZE + c];
    validateBoard(board);

    board_ = board;
    history_.clear();
    moves_played_ = 0;
    undos_played_ = 0;
    game_over_ = isStuck(board_);
}
