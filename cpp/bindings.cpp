#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "game.hpp"
#include "game_defs.hpp"
#include "board.hpp"
#include "terminal.hpp"
#include "evaluate.hpp"
#include "ai.hpp"
#include "utils.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_connect_four_engine, m) {
    m.doc() = "Pybind11 bindings for the C++ Connect Four engine";

    m.attr("ROW_COUNT") = py::int_(ROW_COUNT);
    m.attr("COLUMN_COUNT") = py::int_(COLUMN_COUNT);
    m.attr("CONNECT_LENGTH") = py::int_(CONNECT_LENGTH);
    m.attr("DEFAULT_AI_DEPTH") = py::int_(DEFAULT_AI_DEPTH);
    m.attr("EMPTY") = py::int_(EMPTY);
    m.attr("HUMAN") = py::int_(HUMAN);
    m.attr("AI") = py::int_(AI);
    m.attr("NO_COLUMN") = py::int_(NO_COLUMN);
    m.attr("MOVE_INVALID_COLUMN") = py::int_(MOVE_INVALID_COLUMN);
    m.attr("MOVE_COLUMN_FULL") = py::int_(MOVE_COLUMN_FULL);
    m.attr("MOVE_NOT_YOUR_TURN") = py::int_(MOVE_NOT_YOUR_TURN);
    m.attr("MOVE_GAME_OVER") = py::int_(MOVE_GAME_OVER);

    py::register_exception<InvalidColumnError>(m, "InvalidColumnError", PyExc_IndexError);
    py::register_exception<ColumnFullError>(m, "ColumnFullError", PyExc_RuntimeError);

    m.def("create_board", &createBoard, "Returns an empty board as a list of rows (top row first).",
          py::arg("rows") = ROW_COUNT, py::arg("cols") = COLUMN_COUNT);
    m.def("is_valid_location", &isValidLocation, "True if the column can accept a piece.",
          py::arg("board"), py::arg("col"));
    m.def("get_next_open_row", [](const Board& board, int col) -> py::object {
              int row = getNextOpenRow(board, col);
              if (row == NO_ROW) return py::none();
              return py::int_(row);
          }, "Lowest empty row of the column, or None.", py::arg("board"), py::arg("col"));
    m.def("board_full", &boardFull, "True when every column is filled.", py::arg("board"));
    m.def("get_valid_locations", &getValidLocations, "Columns that can accept a piece, ascending.",
          py::arg("board"));
    m.def("winning_move", &winningMove, "True if the piece has connected four.",
          py::arg("board"), py::arg("piece"));
    m.def("is_terminal_node", &isTerminalNode, "True on a win for either player or a full board.",
          py::arg("board"));
    m.def("evaluate_window", &evaluateWindow, "Heuristic score of one window.",
          py::arg("window"), py::arg("piece"));
    m.def("score_position", &scorePosition, "Heuristic score of the board for the piece.",
          py::arg("board"), py::arg("piece") = AI);
    m.def("ai_decide_move", [](const Board& board, int depth, unsigned int seed, Piece ai_piece) {
              std::mt19937 rng_engine = makeRngEngine(seed);
              return aiDecideMove(board, depth, rng_engine, ai_piece);
          }, "Column chosen by minimax; NO_COLUMN on a full board. seed=0 is non-deterministic.",
          py::arg("board"), py::arg("depth") = DEFAULT_AI_DEPTH, py::arg("seed") = 0,
          py::arg("ai_piece") = AI);

    py::class_<Game>(m, "Game")
        .def(py::init<unsigned int, int, int>(),
             py::arg("seed") = 0, py::arg("rows") = ROW_COUNT, py::arg("cols") = COLUMN_COUNT)
        .def("reset", &Game::reset, "Resets the game to an empty board with HUMAN to move.")
        .def("make_move", &Game::make_move, "Drops a piece for the side to move; returns the row or a MOVE_* code.",
             py::arg("column"))
        .def("human_move", &Game::human_move, "Drops a HUMAN piece; returns the row or a MOVE_* code.",
             py::arg("column"))
        .def("ai_move", &Game::ai_move, "Plays the AI move; returns the column or a MOVE_* code.",
             py::arg("ai_depth") = DEFAULT_AI_DEPTH)
        .def("get_action_from_cpp_expert", &Game::get_action_from_cpp_expert,
             "Gets a move suggestion for the side to move from the C++ search.",
             py::arg("ai_depth"))
        .def("is_game_over", &Game::is_game_over)
        .def("is_draw", &Game::is_draw)
        .def("winner", &Game::winner)
        .def("current_player", &Game::current_player)
        .def("last_ai_column", &Game::last_ai_column)
        .def("is_column_full", &Game::is_column_full, py::arg("column"))
        .def("valid_locations", &Game::valid_locations)
        .def("board", &Game::board)
        .def("get_flat_state", &Game::get_flat_state,
             "Returns the board as a flat row-major list (size rows * cols).")
        .def("set_state_from_flat", &Game::set_state_from_flat,
             "Sets the board from a flat row-major list and the side to move.",
             py::arg("flat_board_data"), py::arg("to_move"))
        .def("set_verbose", &Game::set_verbose, py::arg("verbose"));
}
