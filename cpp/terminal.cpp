#include "terminal.hpp"
#include "board.hpp"

namespace {

// True if the CONNECT_LENGTH cells starting at (row, col) and stepping by
// (d_row, d_col) all hold the piece. The caller keeps the run on the board.
bool runOf(const Board& board, Piece piece, int row, int col, int d_row, int d_col) {
    for (int offset = 0; offset < CONNECT_LENGTH; ++offset) {
        if (board[row + offset * d_row][col + offset * d_col] != piece) {
            return false;
        }
    }
    return true;
}

} // namespace

bool winningMove(const Board& board, Piece piece) {
    const int rows = rowCount(board);
    const int cols = columnCount(board);
    const int span = CONNECT_LENGTH - 1;

    // Horizontal
    for (int row = 0; row < rows; ++row)
        for (int col = 0; col + span < cols; ++col)
            if (runOf(board, piece, row, col, 0, 1)) return true;

    // Vertical
    for (int col = 0; col < cols; ++col)
        for (int row = 0; row + span < rows; ++row)
            if (runOf(board, piece, row, col, 1, 0)) return true;

    // Positive diagonal (down-right)
    for (int row = 0; row + span < rows; ++row)
        for (int col = 0; col + span < cols; ++col)
            if (runOf(board, piece, row, col, 1, 1)) return true;

    // Negative diagonal (up-right)
    for (int row = span; row < rows; ++row)
        for (int col = 0; col + span < cols; ++col)
            if (runOf(board, piece, row, col, -1, 1)) return true;

    return false;
}

bool isTerminalNode(const Board& board) {
    return winningMove(board, HUMAN) || winningMove(board, AI) || boardFull(board);
}

Piece winnerOf(const Board& board) {
    if (winningMove(board, AI)) return AI;
    if (winningMove(board, HUMAN)) return HUMAN;
    return EMPTY;
}
