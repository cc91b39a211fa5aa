#ifndef EVALUATE_HPP
#define EVALUATE_HPP

#include "game_defs.hpp" // For Board, Piece
#include <vector>

using Window = std::vector<Piece>; // CONNECT_LENGTH cells in a straight line

// Scores one window from the perspective of `piece`. Our own lines add,
// opponent lines subtract; a window holding both players scores 0.
int evaluateWindow(const Window& window, Piece piece);

// Sum of evaluateWindow over every horizontal, vertical and diagonal window,
// plus CENTER_PIECE_BONUS for each of our pieces in the middle column.
// Opponent pieces in the middle column are not penalised.
int scorePosition(const Board& board, Piece piece = AI);

#endif // EVALUATE_HPP
