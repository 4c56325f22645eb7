#include "game.hpp"      // For Game, advance
#include "merge.hpp"     // For Board, printBoard, maxTile
#include "utils.hpp"     // For moveName, keyForMove, setDebugLogging
#include "game_defs.hpp" // For BOARD_SIZE, Tile

#include <iostream>
#include <random>       // For std::random_device
#include <stdexcept>
#include <string>
#include <vector>

static void printUsage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " decide [--verbose]          read a " << BOARD_SIZE << "x" << BOARD_SIZE
              << " board (1 = empty) from stdin\n"
              << "  " << prog << " selfplay [episodes] [seed] [--verbose]\n";
}

// Reads BOARD_SIZE * BOARD_SIZE integers, row-major
static Board readBoard(std::istream& in) {
    Board board(BOARD_SIZE, Row(BOARD_SIZE, EMPTY_TILE));
    for (int r = 0; r < BOARD_SIZE; ++r) {
        for (int c = 0; c < BOARD_SIZE; ++c) {
            if (!(in >> board[r][c])) {
                throw std::invalid_argument("Expected " + std::to_string(BOARD_SIZE * BOARD_SIZE)
                                            + " integers on stdin.");
            }
        }
    }
    return board;
}

static int runDecide() {
    Board board = readBoard(std::cin);
    MoveResult result = ::advance(board, KeySink());

    std::cout << moveName(result.move) << '\n' << keyForMove(result.move) << '\n';
    for (const Row& row : result.board) {
        for (int c = 0; c < BOARD_SIZE; ++c) {
            if (c) std::cout << ' ';
            std::cout << row[c];
        }
        std::cout << '\n';
    }
    return 0;
}

static int runSelfPlay(int num_episodes, unsigned int seed) {
    const int MAX_STEPS = 20000; // Undo can cycle, cap each episode

    Game game(seed);
    long total_moves = 0;
    Tile best_tile = EMPTY_TILE;

    for (int i = 0; i < num_episodes; ++i) {
        game.reset();
        int steps = 0;
        while (!game.is_game_over() && steps < MAX_STEPS) {
            game.step();
            ++steps;
        }

        Tile top = maxTile(game.board());
        if (top > best_tile) best_tile = top;
        total_moves += game.moves_played();

        std::cout << "Episode " << i + 1 << "/" << num_episodes << " finished. Max tile: " << top
                  << ", Moves: " << game.moves_played() << ", Undos: " << game.undos_played()
                  << (game.is_game_over() ? "" : " (step cap reached)") << std::endl;
        if (debugLoggingEnabled()) printBoard(game.board());
    }

    std::cout << "\nSelf-play complete." << std::endl;
    std::cout << "Total episodes run: " << num_episodes << std::endl;
    std::cout << "Best tile reached: " << best_tile << std::endl;
    if (num_episodes > 0) {
        double avg_moves = static_cast<double>(total_moves) / num_episodes;
        std::cout << "Average moves per episode: " << avg_moves << std::endl;
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string mode = argv[1];
    std::vector<std::string> positional;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose")
            setDebugLogging(true);
        else
            positional.push_back(arg);
    }

    try {
        if (mode == "decide") {
            return runDecide();
        }
        if (mode == "selfplay") {
            int episodes = positional.size() > 0 ? std::stoi(positional[0]) : 10;
            unsigned int seed = positional.size() > 1
                                    ? static_cast<unsigned int>(std::stoul(positional[1]))
                                    : std::random_device{}();
            return runSelfPlay(episodes, seed);
        }
    } catch (const std::invalid_argument& e) {
        logError("ERROR", e.what());
        return 2;
    } catch (const std::out_of_range& e) {
        logError("ERROR", std::string("Argument out of range: ") + e.what());
        return 2;
    }

    printUsage(argv[0]);
    return 1;
}
