#include "utils.hpp"
#include "game_defs.hpp" // For NO_COLUMN

int pickRandomColumn(const std::vector<int>& columns, std::mt19937& rng_engine) {
    if (columns.empty()) {
        return NO_COLUMN;
    }
    std::uniform_int_distribution<std::size_t> dist(0, columns.size() - 1);
    return columns[dist(rng_engine)];
}

std::mt19937 makeRngEngine(unsigned int seed) {
    if (seed == 0) {
        return std::mt19937(std::random_device{}());
    }
    return std::mt19937(seed);
}
