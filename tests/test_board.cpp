#include "../cpp/board.hpp"
#include <cassert>
#include <iostream>
#include <random>
#include <stdexcept>
#include <utility>

// Drops pieces column by column, as a player would.
static void play(Board& board, std::initializer_list<std::pair<int, Piece>> moves) {
    for (auto move : moves) dropPiece(board, getNextOpenRow(board, move.first), move.first, move.second);
}

static void test_create_board_is_empty() {
    Board board = createBoard();
    assert(rowCount(board) == ROW_COUNT && columnCount(board) == COLUMN_COUNT);
    assert(pieceCount(board, EMPTY) == ROW_COUNT * COLUMN_COUNT && "Fresh board should be all empty");

    Board small = createBoard(4, 5);
    assert(rowCount(small) == 4 && columnCount(small) == 5);
    assert(getValidLocations(small).size() == 5);
}

static void test_next_open_row_fills_from_bottom() {
    Board board = createBoard();
    assert(getNextOpenRow(board, 2) == ROW_COUNT - 1);
    play(board, {{2, HUMAN}, {2, AI}});
    assert(getNextOpenRow(board, 2) == ROW_COUNT - 3);
    assert(board[ROW_COUNT - 1][2] == HUMAN && board[ROW_COUNT - 2][2] == AI);
    assert(getNextOpenRow(board, -1) == NO_ROW && getNextOpenRow(board, COLUMN_COUNT) == NO_ROW);
}

static void test_full_column_is_not_valid() {
    Board board = createBoard();
    for (int i = 0; i < ROW_COUNT; ++i) play(board, {{4, i % 2 == 0 ? HUMAN : AI}});
    assert(!isValidLocation(board, 4) && "Filled column should not accept moves");
    assert(getNextOpenRow(board, 4) == NO_ROW);
    assert(columnFull(board, 4) && !columnFull(board, 3));

    std::vector<int> expected = {0, 1, 2, 3, 5, 6};
    assert(getValidLocations(board) == expected && "Valid columns should be ascending and skip the full one");
}

static void test_validity_matches_open_row_on_random_games() {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick(-2, COLUMN_COUNT + 1);
    for (int game = 0; game < 50; ++game) {
        Board board = createBoard();
        Piece piece = HUMAN;
        for (int step = 0; step < 60; ++step) {
            for (int col = -2; col <= COLUMN_COUNT + 1; ++col) {
                assert(isValidLocation(board, col) == (getNextOpenRow(board, col) != NO_ROW));
            }
            int col = pick(rng);
            if (!isValidLocation(board, col)) continue;
            dropPiece(board, getNextOpenRow(board, col), col, piece);
            piece = opponentOf(piece);
            assert(obeysGravity(board) && "Legal drops must never leave a gap");
        }
    }
}

static void test_board_full() {
    Board board = createBoard();
    assert(!boardFull(board));
    for (int col = 0; col < COLUMN_COUNT; ++col)
        for (int row = 0; row < ROW_COUNT; ++row)
            play(board, {{col, (row + col) % 2 == 0 ? HUMAN : AI}});
    assert(boardFull(board));
    assert(getValidLocations(board).empty());
}

static void test_drop_piece_rejects_illegal_cells() {
    Board board = createBoard();
    bool threw = false;
    try { dropPiece(board, ROW_COUNT - 1, COLUMN_COUNT, HUMAN); } catch (const InvalidColumnError&) { threw = true; }
    assert(threw && "Out-of-range column should raise InvalidColumnError");

    threw = false;
    try { dropPiece(board, 0, 1, HUMAN); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw && "Floating placement should be rejected");
    assert(board[0][1] == EMPTY && "Rejected drop must not touch the board");

    for (int i = 0; i < ROW_COUNT; ++i) play(board, {{0, HUMAN}});
    threw = false;
    try { dropPiece(board, 0, 0, AI); } catch (const ColumnFullError&) { threw = true; }
    assert(threw && "Full column should raise ColumnFullError");

    threw = false;
    try { dropPiece(board, ROW_COUNT - 1, 3, EMPTY); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw && "Placing EMPTY is not a move");
}

static void test_obeys_gravity_detects_floating_pieces() {
    Board board = createBoard();
    assert(obeysGravity(board));
    board[2][3] = AI; // nothing underneath
    assert(!obeysGravity(board));

    Board ragged = createBoard();
    ragged[1].pop_back();
    assert(!obeysGravity(ragged));

    Board unknown = createBoard();
    unknown[ROW_COUNT - 1][0] = 7;
    assert(!obeysGravity(unknown));
}

int main() {
    test_create_board_is_empty();
    test_next_open_row_fills_from_bottom();
    test_full_column_is_not_valid();
    test_validity_matches_open_row_on_random_games();
    test_board_full();
    test_drop_piece_rejects_illegal_cells();
    test_obeys_gravity_detects_floating_pieces();
    std::cout << "All tests passed\n";
    return 0;
}
