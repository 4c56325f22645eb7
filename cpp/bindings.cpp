#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "game.hpp"
#include "game_defs.hpp"
#include "pivot.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_slide_engine, m) {
    m.doc() = "Pybind11 bindings for the C++ 2048 decision engine";

    m.attr("BOARD_SIZE") = py::int_(BOARD_SIZE);
    m.attr("EMPTY_TILE") = py::int_(EMPTY_TILE);

    py::enum_<Move>(m, "Move")
        .value("NONE", MOVE_NONE)
        .value("UP", MOVE_UP)
        .value("DOWN", MOVE_DOWN)
        .value("LEFT", MOVE_LEFT)
        .value("RIGHT", MOVE_RIGHT)
        .value("UNDO", MOVE_UNDO);

    py::class_<HeuristicConfig>(m, "HeuristicConfig")
        .def(py::init<>())
        .def_readwrite("snake_base", &HeuristicConfig::snake_base)
        .def_readwrite("value_base", &HeuristicConfig::value_base)
        .def_readwrite("pivot_threshold", &HeuristicConfig::pivot_threshold)
        .def_readwrite("lookahead_depth", &HeuristicConfig::lookahead_depth);

    m.def("move_name", &moveName, "Label of a move ('down', 'undo', ...).", py::arg("move"));
    m.def("move_from_name", &moveFromName, "Move for a label; raises ValueError if unknown.", py::arg("name"));
    m.def("key_for_move", &keyForMove, "Key pressed for a move ('u' for undo).", py::arg("move"));
    m.def("set_debug_logging", &setDebugLogging, "Enables [TAG] debug lines on stdout.", py::arg("enabled"));

    m.def("slide", &slideBoard, "Board after sliding down, left or right.",
          py::arg("board"), py::arg("direction"));
    m.def("score", static_cast<double (*)(const Board&, const HeuristicConfig&)>(&positionalScore),
          "Positional score of a board.", py::arg("board"), py::arg("config") = HeuristicConfig());
    m.def("longest_snake", &longestSnake, "Non-increasing snake prefix from the bottom-right corner.",
          py::arg("board"));
    m.def("check_pivots", static_cast<Move (*)(const Board&, const HeuristicConfig&)>(&checkPivots),
          "Forced corrective move, or Move.NONE.", py::arg("board"), py::arg("config") = HeuristicConfig());
    m.def("next_move", static_cast<Move (*)(const Board&, const HeuristicConfig&)>(&nextMove),
          "Move chosen by the pivot check and lookahead search.",
          py::arg("board"), py::arg("config") = HeuristicConfig());
    m.def("advance",
          [](const Board& board, const KeySink& sink, const HeuristicConfig& config) {
              MoveResult result = advance(board, sink, config);
              return py::make_tuple(result.board, result.move);
          },
          "Decides and applies one move, calling key_sink(move). Returns (board, move).",
          py::arg("board"), py::arg("key_sink") = KeySink(), py::arg("config") = HeuristicConfig());

    py::class_<Game>(m, "Game")
        .def(py::init<>())
        .def(py::init<unsigned int>(), py::arg("seed"))
        .def("reset", &Game::reset, "Resets the game to an initial state.")
        .def("step", &Game::step, "Plays one decision cycle and returns the move issued.")
        .def("spawn_tile", &Game::spawnTile, "Places a 2 or 4 on a random empty cell.")
        .def("get_flat_state", &Game::get_flat_state,
             "Returns the current board as a flat row-major list (size BOARD_SIZE * BOARD_SIZE).")
        .def("is_game_over", &Game::is_game_over, "Checks if the game is over.")
        .def("moves_played", &Game::moves_played)
        .def("undos_played", &Game::undos_played)
        .def("set_config", &Game::set_config, py::arg("config"))
        .def("set_key_sink", &Game::set_key_sink, py::arg("key_sink"))
        .def("set_board_from_flat", &Game::set_board_from_flat,
             "Sets the board from a flat row-major list.", py::arg("flat_board_data"));
}
