#ifndef GAME_HPP
#define GAME_HPP

#include "game_defs.hpp" // For Board, Piece, ROW_COUNT, COLUMN_COUNT
#include <vector>
#include <random>       // For std::mt19937

// Status codes returned by the move methods in place of a row or column
const int MOVE_INVALID_COLUMN = -1;
const int MOVE_COLUMN_FULL = -2;
const int MOVE_NOT_YOUR_TURN = -3;
const int MOVE_GAME_OVER = -4;

// State of one human-vs-AI game. HUMAN moves first.
class Game {
public:
    // seed == 0 seeds the tie-break engine from std::random_device
    explicit Game(unsigned int seed = 0, int rows = ROW_COUNT, int cols = COLUMN_COUNT);
    void reset();

    // Drops a piece for the side to move. Returns the row used or a MOVE_* code.
    int make_move(int column);

    // Like make_move, but only when it is HUMAN's turn.
    int human_move(int column);

    // Searches `ai_depth` plies and plays for AI. Returns the column used or a MOVE_* code.
    int ai_move(int ai_depth = DEFAULT_AI_DEPTH);

    // Suggestion for the side to move; does not change the game.
    int get_action_from_cpp_expert(int ai_depth);

    bool is_game_over() const;
    bool is_draw() const;
    Piece winner() const;
    Piece current_player() const;
    int last_ai_column() const;
    bool is_column_full(int col) const;
    std::vector<int> valid_locations() const;
    const Board& board() const;

    // Row-major copy of the board (size rows * cols)
    std::vector<Piece> get_flat_state() const;

    // Loads a row-major board and the side to move. Rejects (returns false)
    // data of the wrong size, unknown pieces or floating pieces.
    bool set_state_from_flat(const std::vector<Piece>& flat_board_data, Piece to_move);

    void set_verbose(bool verbose);

private:
    // Places for `piece` and updates winner/game-over/turn. The column must be open.
    int apply_move(int column, Piece piece);
    void refresh_status();

    int rows_;
    int cols_;
    Board board_;
    Piece to_move_;
    Piece winner_;
    bool game_over_;
    int last_ai_column_;
    bool verbose_;
    std::mt19937 rng_engine_;
};

#endif // GAME_HPP
