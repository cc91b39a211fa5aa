#ifndef TERMINAL_HPP
#define TERMINAL_HPP

#include "game_defs.hpp" // For Board, Piece, CONNECT_LENGTH

// Checks horizontal, vertical and both diagonal directions for
// CONNECT_LENGTH consecutive cells holding the given piece
bool winningMove(const Board& board, Piece piece);

// Terminal when either player has connected four or the board is full
bool isTerminalNode(const Board& board);

// Returns AI, HUMAN or EMPTY (no winner yet, or a draw).
// If both players have a line, AI is reported.
Piece winnerOf(const Board& board);

#endif // TERMINAL_HPP
