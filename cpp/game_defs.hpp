#ifndef GAME_DEFS_HPP
#define GAME_DEFS_HPP

#include <vector>
#include <limits>

// Define fundamental types for clarity
using Piece = int;
using Row = std::vector<Piece>;   // One row of cells, left to right
using Board = std::vector<Row>;   // Rows top to bottom: board[0] is the top row

// Cell values
const Piece EMPTY = 0;
const Piece HUMAN = 1; // Player A, moves first
const Piece AI = 2;    // Player B, the machine player

// === Game Configuration ===
const int ROW_COUNT = 6;        // Default number of rows
const int COLUMN_COUNT = 7;     // Default number of columns
const int CONNECT_LENGTH = 4;   // Pieces in a line needed to win
const int DEFAULT_AI_DEPTH = 3; // Plies searched by the AI when not told otherwise
// ==========================

// Sentinels
const int NO_ROW = -1;
const int NO_COLUMN = -1;

// Search scores. SCORE_INFINITY stands for a forced win, -SCORE_INFINITY for a forced loss.
const int SCORE_INFINITY = std::numeric_limits<int>::max();

// === Evaluation weights ===
const int WINDOW_FOUR_SCORE = 100000;
const int WINDOW_THREE_SCORE = 100;
const int WINDOW_TWO_SCORE = 10;
const int WINDOW_OPP_FOUR_PENALTY = 100000;
const int WINDOW_OPP_THREE_PENALTY = 120; // Heavier than our own three so blocking wins ties
const int WINDOW_OPP_TWO_PENALTY = 12;
const int CENTER_PIECE_BONUS = 6;
// ==========================

inline Piece opponentOf(Piece piece) {
    return piece == AI ? HUMAN : AI;
}

#endif // GAME_DEFS_HPP
