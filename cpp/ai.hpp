#pragma once
#include "game_defs.hpp"
#include <random>
#include <vector>

// Outcome of a minimax call. column is NO_COLUMN at leaves.
struct SearchResult {
    int column;
    int score; // heuristic value, or +/-SCORE_INFINITY for a forced win/loss
};

// Copy of the board with `piece` dropped into `col`. The column must be open.
Board simulateDrop(const Board& board, Piece piece, int col);

// Depth-limited minimax. aiPiece is the maximizing side; rng_engine supplies
// the initial best column at every inner node, so a fixed seed gives a fixed tree.
SearchResult minimax(const Board& board, int depth, bool maximizingPlayer,
                     std::mt19937& rng_engine, Piece aiPiece = AI);

// Column chosen for aiPiece. Falls back to a random legal column when the
// search returns none, and returns NO_COLUMN when the board is full.
int aiDecideMove(const Board& board, int depth, std::mt19937& rng_engine,
                 Piece aiPiece = AI, bool verbose = false);
