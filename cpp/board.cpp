#include "board.hpp"
#include <stdexcept>
#include <string>

Board createBoard(int rows, int cols) {
    if (rows < 0 || cols < 0) {
        throw std::invalid_argument("Board dimensions must be non-negative");
    }
    return Board(rows, Row(cols, EMPTY));
}

int rowCount(const Board& board) {
    return static_cast<int>(board.size());
}

int columnCount(const Board& board) {
    return board.empty() ? 0 : static_cast<int>(board[0].size());
}

bool isValidLocation(const Board& board, int col) {
    return col >= 0 && col < columnCount(board) && board[0][col] == EMPTY;
}

int getNextOpenRow(const Board& board, int col) {
    if (col < 0 || col >= columnCount(board)) {
        return NO_ROW;
    }
    for (int row = rowCount(board) - 1; row >= 0; --row) {
        if (board[row][col] == EMPTY) {
            return row;
        }
    }
    return NO_ROW;
}

void dropPiece(Board& board, int row, int col, Piece piece) {
    if (col < 0 || col >= columnCount(board)) {
        throw InvalidColumnError(col);
    }
    if (piece != HUMAN && piece != AI) {
        throw std::invalid_argument("Unknown piece value: " + std::to_string(piece));
    }
    int open_row = getNextOpenRow(board, col);
    if (open_row == NO_ROW) {
        throw ColumnFullError(col);
    }
    if (row != open_row) {
        throw std::invalid_argument("Row " + std::to_string(row) + " is not the next open row (" +
                                    std::to_string(open_row) + ") of column " + std::to_string(col));
    }
    board[row][col] = piece;
}

bool boardFull(const Board& board) {
    for (int col = 0; col < columnCount(board); ++col) {
        if (board[0][col] == EMPTY) {
            return false;
        }
    }
    return true;
}

std::vector<int> getValidLocations(const Board& board) {
    std::vector<int> valid;
    valid.reserve(columnCount(board));
    for (int col = 0; col < columnCount(board); ++col) {
        if (isValidLocation(board, col)) {
            valid.push_back(col);
        }
    }
    return valid;
}

bool columnFull(const Board& board, int col) {
    if (col < 0 || col >= columnCount(board)) return true;
    return board[0][col] != EMPTY;
}

int pieceCount(const Board& board, Piece piece) {
    int count = 0;
    for (const auto& row : board)
        for (Piece cell : row)
            if (cell == piece) ++count;
    return count;
}

bool obeysGravity(const Board& board) {
    const int cols = columnCount(board);
    for (const auto& row : board) {
        if (static_cast<int>(row.size()) != cols) return false;
        for (Piece cell : row) {
            if (cell != EMPTY && cell != HUMAN && cell != AI) return false;
        }
    }
    // Once a column has a piece, every cell below it must be occupied too
    for (int col = 0; col < cols; ++col) {
        bool seen_piece = false;
        for (int row = 0; row < rowCount(board); ++row) {
            if (board[row][col] != EMPTY) {
                seen_piece = true;
            } else if (seen_piece) {
                return false;
            }
        }
    }
    return true;
}
