#ifndef GAME_HPP
#define GAME_HPP

#include "game_defs.hpp" // For Board, Tile, Move, KeySink, HeuristicConfig
#include "merge.hpp"     // For slideBoard, emptyBoard etc.
#include "utils.hpp"     // For moveName, logDebug
#include "ai.hpp"        // To get nextMove declaration
#include <deque>
#include <random>        // For std::mt19937
#include <vector>

// Board after a decision together with the move actually issued
struct MoveResult {
    Board board;
    Move move;
};

// Decides and applies one move. MOVE_UNDO is sent to the sink and yields an
// all-empty board. A move that leaves the board unchanged is replaced by the
// next one in the down -> left -> right rotation, at most three tries in all.
MoveResult advance(const Board& board, const KeySink& sink);
MoveResult advance(const Board& board, const KeySink& sink, const HeuristicConfig& config);

// Next direction in the no-op rotation
Move rotateMove(Move move);

// A simulated game driven by advance(): spawns tiles after every move and
// answers MOVE_UNDO by restoring the previous board.
class Game {
public:
    Game(); // Constructor
    explicit Game(unsigned int seed);
    void reset();

    // One decision cycle; returns the move issued, or MOVE_NONE once the game is over
    Move step();

    // Places a 2 (or a 4 with SPAWN_FOUR_PROBABILITY) on a random empty cell; false when full
    bool spawnTile();

    std::vector<Tile> get_flat_state() const;
    const Board& board() const;
    bool is_game_over() const;
    int moves_played() const;
    int undos_played() const;

    void set_config(const HeuristicConfig& config);
    void set_key_sink(const KeySink& sink);

    // Takes a flat row-major board representation; starts a fresh position
    // (no undo history, move counters at zero)
    void set_board_from_flat(const std::vector<Tile>& flat_board_data);

private:
    Board board_;
    std::deque<Board> history_;
    std::mt19937 rng_engine_;
    HeuristicConfig config_;
    KeySink sink_;
    bool game_over_;
    int moves_played_;
    int undos_played_;
};

#endif // GAME_HPP
