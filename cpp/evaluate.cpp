#include "evaluate.hpp"
#include "board.hpp"
#include <algorithm>

int evaluateWindow(const Window& window, Piece piece) {
    const Piece opp_piece = opponentOf(piece);
    const int count_self = static_cast<int>(std::count(window.begin(), window.end(), piece));
    const int count_opp = static_cast<int>(std::count(window.begin(), window.end(), opp_piece));
    const int count_empty = static_cast<int>(std::count(window.begin(), window.end(), EMPTY));

    int score = 0;
    if (count_self == CONNECT_LENGTH) {
        score += WINDOW_FOUR_SCORE;
    } else if (count_self == CONNECT_LENGTH - 1 && count_empty == 1) {
        score += WINDOW_THREE_SCORE;
    } else if (count_self == CONNECT_LENGTH - 2 && count_empty == 2) {
        score += WINDOW_TWO_SCORE;
    }

    if (count_opp == CONNECT_LENGTH) {
        score -= WINDOW_OPP_FOUR_PENALTY;
    } else if (count_opp == CONNECT_LENGTH - 1 && count_empty == 1) {
        score -= WINDOW_OPP_THREE_PENALTY;
    } else if (count_opp == CONNECT_LENGTH - 2 && count_empty == 2) {
        score -= WINDOW_OPP_TWO_PENALTY;
    }
    return score;
}

int scorePosition(const Board& board, Piece piece) {
    const int rows = rowCount(board);
    const int cols = columnCount(board);
    const int span = CONNECT_LENGTH - 1;
    int score = 0;

    // Center control
    const int center_column = cols / 2;
    for (int row = 0; row < rows && cols > 0; ++row) {
        if (board[row][center_column] == piece) score += CENTER_PIECE_BONUS;
    }

    Window window(CONNECT_LENGTH);
    auto scoreRun = [&](int row, int col, int d_row, int d_col) {
        for (int offset = 0; offset < CONNECT_LENGTH; ++offset) {
            window[offset] = board[row + offset * d_row][col + offset * d_col];
        }
        score += evaluateWindow(window, piece);
    };

    // Horizontal
    for (int row = 0; row < rows; ++row)
        for (int col = 0; col + span < cols; ++col) scoreRun(row, col, 0, 1);

    // Vertical
    for (int col = 0; col < cols; ++col)
        for (int row = 0; row + span < rows; ++row) scoreRun(row, col, 1, 0);

    // Positive diagonal
    for (int row = 0; row + span < rows; ++row)
        for (int col = 0; col + span < cols; ++col) scoreRun(row, col, 1, 1);

    // Negative diagonal
    for (int row = span; row < rows; ++row)
        for (int col = 0; col + span < cols; ++col) scoreRun(row, col, -1, 1);

    return score;
}
