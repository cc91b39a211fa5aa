#include "game_defs.hpp" // For ROW_COUNT, COLUMN_COUNT, HUMAN, AI
#include "board.hpp"     // For createBoard, dropPiece, getNextOpenRow
#include "terminal.hpp"  // For winnerOf, isTerminalNode
#include "ai.hpp"        // For aiDecideMove
#include "utils.hpp"     // For makeRngEngine, pickRandomColumn

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <random>
#include <sstream>      // For std::ostringstream
#include <stdexcept>

// Serializes the board to a flat row-major JSON array, top row first
std::string serializeBoardFlat(const Board& board) {
    std::ostringstream oss;
    oss << "[";
    bool first_overall = true;
    for (const auto& row : board) {
        for (Piece cell : row) {
            if (!first_overall) {
                oss << ",";
            }
            oss << cell;
            first_overall = false;
        }
    }
    oss << "]";
    return oss.str();
}

// Usage: selfplay_logger [episodes] [depth] [output_path] [seed]
int main(int argc, char* argv[]) {
    int num_episodes = 100;
    int ai_depth = DEFAULT_AI_DEPTH;
    std::string output_file_path = "data/selfplay_games.jsonl";
    unsigned int seed = 0;

    try {
        if (argc > 1) num_episodes = std::stoi(argv[1]);
        if (argc > 2) ai_depth = std::stoi(argv[2]);
        if (argc > 3) output_file_path = argv[3];
        if (argc > 4) seed = static_cast<unsigned int>(std::stoul(argv[4]));
    } catch (const std::exception& e) {
        std::cerr << "Error: Could not parse arguments (" << e.what() << ")." << std::endl;
        std::cerr << "Usage: " << argv[0] << " [episodes] [depth] [output_path] [seed]" << std::endl;
        return 1;
    }

    std::ofstream outfile(output_file_path);
    if (!outfile.is_open()) {
        std::cerr << "Error: Could not open " << output_file_path << " for writing." << std::endl;
        std::cerr << "Please ensure the parent directory exists relative to the executable's CWD." << std::endl;
        return 1;
    }

    std::mt19937 rng_engine = makeRngEngine(seed);

    long total_moves_logged = 0;
    int human_wins = 0;
    int ai_wins = 0;
    int draws = 0;

    for (int i = 0; i < num_episodes; ++i) {
        Board board = createBoard();
        Piece to_move = HUMAN;
        int moves_this_episode = 0;

        while (!isTerminalNode(board)) {
            std::string state_before_action_str = serializeBoardFlat(board);

            // Each side searches as the maximizer for its own piece
            int action = aiDecideMove(board, ai_depth, rng_engine, to_move);
            if (!isValidLocation(board, action)) {
                std::cout << "[WARNING] AI suggested invalid or full column: " << action
                          << ". Attempting fallback to a random open column." << std::endl;
                action = pickRandomColumn(getValidLocations(board), rng_engine);
                if (action == NO_COLUMN) {
                    std::cout << "[ERROR] No valid column to place a piece. Ending episode prematurely." << std::endl;
                    break;
                }
            }

            dropPiece(board, getNextOpenRow(board, action), action, to_move);

            bool done = isTerminalNode(board);
            outfile << "{";
            outfile << "\"state\":" << state_before_action_str << ",";
            outfile << "\"player\":" << to_move << ",";
            outfile << "\"action\":" << action << ",";
            outfile << "\"next_state\":" << serializeBoardFlat(board) << ",";
            outfile << "\"done\":" << (done ? "true" : "false") << ",";
            outfile << "\"winner\":" << (done ? winnerOf(board) : EMPTY);
            outfile << "}\n";
            total_moves_logged++;
            moves_this_episode++;

            to_move = opponentOf(to_move);
        }
        outfile.flush();

        Piece winner = winnerOf(board);
        if (winner == HUMAN) {
            human_wins++;
        } else if (winner == AI) {
            ai_wins++;
        } else {
            draws++;
        }
        std::cout << "Episode " << i + 1 << "/" << num_episodes << " finished. Winner: " << winner
                  << ", Moves in episode: " << moves_this_episode << std::endl;
    }

    outfile.close();
    std::cout << "\nSelf-play data generation complete." << std::endl;
    std::cout << "Total episodes run: " << num_episodes << std::endl;
    std::cout << "Total moves logged: " << total_moves_logged << std::endl;
    std::cout << "Wins (player 1 / player 2 / draws): " << human_wins << " / " << ai_wins << " / " << draws << std::endl;
    if (num_episodes > 0) {
        double avg_moves = static_cast<double>(total_moves_logged) / num_episodes;
        std::cout << "Average moves per episode: " << avg_moves << std::endl;
    }
    std::cout << "Data saved to " << output_file_path << std::endl;
    return 0;
}
