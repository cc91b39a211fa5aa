#include "ai.hpp"
#include "board.hpp"
#include "terminal.hpp"
#include "evaluate.hpp"
#include "utils.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

std::string formatScore(int score) {
    if (score == SCORE_INFINITY) return "+inf";
    if (score == -SCORE_INFINITY) return "-inf";
    return std::to_string(score);
}

} // namespace

Board simulateDrop(const Board& board, Piece piece, int col) {
    Board newBoard = board;
    dropPiece(newBoard, getNextOpenRow(newBoard, col), col, piece);
    return newBoard;
}

SearchResult minimax(const Board& board, int depth, bool maximizingPlayer,
                     std::mt19937& rng_engine, Piece aiPiece) {
    const Piece oppPiece = opponentOf(aiPiece);
    const bool terminal = isTerminalNode(board);

    if (depth <= 0 || terminal) {
        if (terminal) {
            // Our own line is checked first, so a board with both lines counts as a win
            if (winningMove(board, aiPiece)) return {NO_COLUMN, SCORE_INFINITY};
            if (winningMove(board, oppPiece)) return {NO_COLUMN, -SCORE_INFINITY};
            return {NO_COLUMN, 0}; // Draw
        }
        return {NO_COLUMN, scorePosition(board, aiPiece)};
    }

    const std::vector<int> validLocations = getValidLocations(board);

    if (maximizingPlayer) {
        SearchResult best{pickRandomColumn(validLocations, rng_engine), -SCORE_INFINITY};
        for (int col : validLocations) {
            Board child = simulateDrop(board, aiPiece, col);
            int childScore = minimax(child, depth - 1, false, rng_engine, aiPiece).score;
            if (childScore > best.score) {
                best.score = childScore;
                best.column = col;
            }
        }
        return best;
    }

    SearchResult best{pickRandomColumn(validLocations, rng_engine), SCORE_INFINITY};
    for (int col : validLocations) {
        Board child = simulateDrop(board, oppPiece, col);
        int childScore = minimax(child, depth - 1, true, rng_engine, aiPiece).score;
        if (childScore < best.score) {
            best.score = childScore;
            best.column = col;
        }
    }
    return best;
}

int aiDecideMove(const Board& board, int depth, std::mt19937& rng_engine,
                 Piece aiPiece, bool verbose) {
    SearchResult result = minimax(board, depth, true, rng_engine, aiPiece);
    if (verbose) {
        std::cout << "[AI_DEBUG] piece=" << aiPiece << " depth=" << depth
                  << " column=" << result.column << " score=" << formatScore(result.score) << std::endl;
    }
    if (result.column != NO_COLUMN) {
        return result.column;
    }

    const std::vector<int> valid = getValidLocations(board);
    if (valid.empty()) {
        std::cerr << "[ERROR] aiDecideMove called on a board with no legal column." << std::endl;
        return NO_COLUMN;
    }
    int fallback = pickRandomColumn(valid, rng_engine);
    if (verbose) {
        std::cout << "[WARNING] Search returned no column at depth " << depth
                  << ". Falling back to random column " << fallback << "." << std::endl;
    }
    return fallback;
}
