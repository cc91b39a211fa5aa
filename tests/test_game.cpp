#include "../cpp/game.hpp"
#include "../cpp/board.hpp"
#include <cassert>
#include <iostream>
#include <vector>

static void test_new_game_state() {
    Game game(17);
    assert(game.current_player() == HUMAN && "HUMAN moves first");
    assert(!game.is_game_over() && game.winner() == EMPTY);
    assert(game.last_ai_column() == NO_COLUMN);
    assert(game.valid_locations().size() == static_cast<size_t>(COLUMN_COUNT));
    assert(game.get_flat_state() == std::vector<Piece>(ROW_COUNT * COLUMN_COUNT, EMPTY));
}

static void test_turns_alternate() {
    Game game(17);
    assert(game.human_move(3) == ROW_COUNT - 1);
    assert(game.current_player() == AI);
    assert(game.human_move(2) == MOVE_NOT_YOUR_TURN && "HUMAN cannot move twice");

    int col = game.ai_move(2);
    assert(col >= 0 && col < COLUMN_COUNT);
    assert(game.last_ai_column() == col);
    assert(game.current_player() == HUMAN);
    assert(game.ai_move(2) == MOVE_NOT_YOUR_TURN);
    assert(pieceCount(game.board(), HUMAN) == 1 && pieceCount(game.board(), AI) == 1);
}

static void test_invalid_and_full_columns_are_reported() {
    Game game(17);
    assert(game.human_move(-1) == MOVE_INVALID_COLUMN);
    assert(game.human_move(COLUMN_COUNT) == MOVE_INVALID_COLUMN);
    assert(game.current_player() == HUMAN && "Rejected move keeps the turn");

    for (int i = 0; i < ROW_COUNT; ++i) assert(game.make_move(0) >= 0);
    assert(game.is_column_full(0));
    assert(game.make_move(0) == MOVE_COLUMN_FULL);
}

static void test_human_win_ends_game() {
    Game game(17);
    // HUMAN builds across the bottom while AI stacks on column 6.
    for (int col = 0; col < 3; ++col) {
        assert(game.make_move(col) >= 0);
        assert(game.make_move(6) >= 0);
    }
    assert(game.human_move(3) == ROW_COUNT - 1);
    assert(game.is_game_over() && game.winner() == HUMAN && !game.is_draw());
    assert(game.make_move(4) == MOVE_GAME_OVER);
    assert(game.ai_move() == MOVE_GAME_OVER);

    game.reset();
    assert(!game.is_game_over() && game.current_player() == HUMAN);
}

static void test_ai_takes_the_win() {
    Game game(17);
    std::vector<Piece> flat(ROW_COUNT * COLUMN_COUNT, EMPTY);
    const int bottom = (ROW_COUNT - 1) * COLUMN_COUNT;
    flat[bottom + 0] = AI;
    flat[bottom + 1] = AI;
    flat[bottom + 2] = AI;
    flat[bottom + 5] = HUMAN;
    flat[bottom + 6] = HUMAN;
    flat[bottom - COLUMN_COUNT + 6] = HUMAN;
    assert(game.set_state_from_flat(flat, AI));

    assert(game.get_action_from_cpp_expert(3) == 3);
    assert(game.current_player() == AI && "Suggestions do not play");
    assert(game.ai_move(3) == 3);
    assert(game.is_game_over() && game.winner() == AI);
}

static void test_draw_is_detected() {
    Game game(17);
    std::vector<Piece> flat(ROW_COUNT * COLUMN_COUNT, EMPTY);
    for (int row = 0; row < ROW_COUNT; ++row)
        for (int col = 0; col < COLUMN_COUNT; ++col)
            flat[row * COLUMN_COUNT + col] = ((col / 2) + row) % 2 == 0 ? HUMAN : AI;
    flat[6] = EMPTY; // top-right cell is the last open one
    assert(game.set_state_from_flat(flat, AI));
    assert(!game.is_game_over());

    assert(game.ai_move() == 6);
    assert(game.is_game_over() && game.is_draw() && game.winner() == EMPTY);
}

static void test_set_state_rejects_bad_boards() {
    Game game(17);
    assert(game.human_move(3) >= 0);
    const std::vector<Piece> before = game.get_flat_state();

    assert(!game.set_state_from_flat(std::vector<Piece>(5, EMPTY), HUMAN) && "Wrong size");

    std::vector<Piece> floating(ROW_COUNT * COLUMN_COUNT, EMPTY);
    floating[0] = AI;
    assert(!game.set_state_from_flat(floating, HUMAN) && "Piece with nothing under it");

    std::vector<Piece> unknown(ROW_COUNT * COLUMN_COUNT, EMPTY);
    unknown[(ROW_COUNT - 1) * COLUMN_COUNT] = 9;
    assert(!game.set_state_from_flat(unknown, HUMAN));

    assert(!game.set_state_from_flat(std::vector<Piece>(ROW_COUNT * COLUMN_COUNT, EMPTY), EMPTY));
    assert(game.get_flat_state() == before && "Rejected loads leave the game alone");
}

static void test_same_seed_same_game() {
    Game first(2024);
    Game second(2024);
    for (int turn = 0; turn < 8 && !first.is_game_over(); ++turn) {
        int col = turn % COLUMN_COUNT;
        int row_a = first.human_move(col);
        int row_b = second.human_move(col);
        assert(row_a == row_b);
        if (first.is_game_over()) break;
        assert(first.ai_move(2) == second.ai_move(2));
    }
    assert(first.get_flat_state() == second.get_flat_state());
}

static void test_custom_dimensions() {
    Game game(5, 5, 6);
    assert(game.get_flat_state().size() == 30);
    assert(game.valid_locations().size() == 6);
    assert(game.human_move(5) == 4);
}

int main() {
    test_new_game_state();
    test_turns_alternate();
    test_invalid_and_full_columns_are_reported();
    test_human_win_ends_game();
    test_ai_takes_the_win();
    test_draw_is_detected();
    test_set_state_rejects_bad_boards();
    test_same_seed_same_game();
    test_custom_dimensions();
    std::cout << "All tests passed\n";
    return 0;
}
