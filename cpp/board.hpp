#ifndef BOARD_HPP
#define BOARD_HPP

#include "game_defs.hpp" // For Board, Piece, ROW_COUNT, COLUMN_COUNT
#include <stdexcept>
#include <string>
#include <vector>

// Raised by dropPiece when the column is outside [0, columnCount).
class InvalidColumnError : public std::out_of_range {
public:
    explicit InvalidColumnError(int col)
        : std::out_of_range("Invalid column: " + std::to_string(col)) {}
};

// Raised by dropPiece when the column has no open row left.
class ColumnFullError : public std::runtime_error {
public:
    explicit ColumnFullError(int col)
        : std::runtime_error("Column full: " + std::to_string(col)) {}
};

// Creates an empty board of the given size
Board createBoard(int rows = ROW_COUNT, int cols = COLUMN_COUNT);

int rowCount(const Board& board);
int columnCount(const Board& board);

// True if col is on the board and its top cell is empty
bool isValidLocation(const Board& board, int col);

// Lowest empty row of a column (highest row index), or NO_ROW if the
// column is full or out of range
int getNextOpenRow(const Board& board, int col);

// Places a piece at (row, col). The caller is expected to pass the row
// returned by getNextOpenRow; anything else throws (see InvalidColumnError,
// ColumnFullError, std::invalid_argument).
void dropPiece(Board& board, int row, int col, Piece piece);

// True when every column is filled to the top
bool boardFull(const Board& board);

// All columns that can accept a move, in ascending order
std::vector<int> getValidLocations(const Board& board);

// --- Utility functions often needed by AI or game logic ---

// Checks if a specific column is full (out-of-range columns count as full)
bool columnFull(const Board& board, int col);

// Number of cells holding the given piece
int pieceCount(const Board& board, Piece piece);

// True if the board is rectangular, holds only known piece values, and no
// piece floats above an empty cell
bool obeysGravity(const Board& board);

#endif // BOARD_HPP
