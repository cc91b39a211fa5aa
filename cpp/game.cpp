#include "game.hpp"
#include "board.hpp"
#include "terminal.hpp"
#include "ai.hpp"
#include "utils.hpp"
#include <iostream>

Game::Game(unsigned int seed, int rows, int cols)
    : rows_(rows), cols_(cols), verbose_(false), rng_engine_(makeRngEngine(seed)) {
    reset();
}

void Game::reset() {
    board_ = createBoard(rows_, cols_);
    to_move_ = HUMAN;
    winner_ = EMPTY;
    game_over_ = false;
    last_ai_column_ = NO_COLUMN;
}

int Game::make_move(int column) {
    if (game_over_) {
        return MOVE_GAME_OVER;
    }
    if (column < 0 || column >= cols_) {
        return MOVE_INVALID_COLUMN;
    }
    if (::columnFull(board_, column)) {
        return MOVE_COLUMN_FULL;
    }
    return apply_move(column, to_move_);
}

int Game::human_move(int column) {
    if (!game_over_ && to_move_ != HUMAN) {
        return MOVE_NOT_YOUR_TURN;
    }
    last_ai_column_ = NO_COLUMN;
    return make_move(column);
}

int Game::ai_move(int ai_depth) {
    if (game_over_) {
        return MOVE_GAME_OVER;
    }
    if (to_move_ != AI) {
        return MOVE_NOT_YOUR_TURN;
    }

    int column = aiDecideMove(board_, ai_depth, rng_engine_, AI, verbose_);
    if (!isValidLocation(board_, column)) {
        std::cout << "[WARNING] AI suggested invalid or full column: " << column
                  << ". Picking a random open column." << std::endl;
        column = pickRandomColumn(getValidLocations(board_), rng_engine_);
        if (column == NO_COLUMN) {
            std::cerr << "[ERROR] No valid column for the AI move." << std::endl;
            return MOVE_COLUMN_FULL;
        }
    }

    apply_move(column, AI);
    last_ai_column_ = column;
    return column;
}

int Game::get_action_from_cpp_expert(int ai_depth) {
    return aiDecideMove(board_, ai_depth, rng_engine_, to_move_, verbose_);
}

bool Game::is_game_over() const {
    return game_over_;
}

bool Game::is_draw() const {
    return game_over_ && winner_ == EMPTY;
}

Piece Game::winner() const {
    return winner_;
}

Piece Game::current_player() const {
    return to_move_;
}

int Game::last_ai_column() const {
    return last_ai_column_;
}

bool Game::is_column_full(int col) const {
    return ::columnFull(board_, col);
}

std::vector<int> Game::valid_locations() const {
    return getValidLocations(board_);
}

const Board& Game::board() const {
    return board_;
}

std::vector<Piece> Game::get_flat_state() const {
    std::vector<Piece> flat_state;
    flat_state.reserve(rows_ * cols_);
    for (const auto& row : board_) {
        flat_state.insert(flat_state.end(), row.begin(), row.end());
    }
    return flat_state;
}

bool Game::set_state_from_flat(const std::vector<Piece>& flat_board_data, Piece to_move) {
    if (flat_board_data.size() != static_cast<size_t>(rows_ * cols_)) {
        std::cerr << "Error: Invalid flat_board_data size in set_state_from_flat: expected "
                  << rows_ * cols_ << ", got " << flat_board_data.size() << "." << std::endl;
        return false;
    }
    if (to_move != HUMAN && to_move != AI) {
        std::cerr << "Error: Invalid side to move in set_state_from_flat: " << to_move << "." << std::endl;
        return false;
    }

    Board loaded = createBoard(rows_, cols_);
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            loaded[r][c] = flat_board_data[r * cols_ + c];
        }
    }
    if (!obeysGravity(loaded)) {
        std::cerr << "Error: set_state_from_flat got unknown pieces or floating pieces." << std::endl;
        return false;
    }

    board_ = loaded;
    to_move_ = to_move;
    last_ai_column_ = NO_COLUMN;
    refresh_status();
    return true;
}

void Game::set_verbose(bool verbose) {
    verbose_ = verbose;
}

int Game::apply_move(int column, Piece piece) {
    int row = getNextOpenRow(board_, column);
    dropPiece(board_, row, column, piece);
    to_move_ = opponentOf(piece);
    refresh_status();
    return row;
}

void Game::refresh_status() {
    // Mirrors the turn-end checks: win first, then draw
    winner_ = winnerOf(board_);
    game_over_ = winner_ != EMPTY || boardFull(board_);
}
