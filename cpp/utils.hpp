#ifndef UTILS_HPP
#define UTILS_HPP

#include <random>  // For std::mt19937
#include <vector>

// Picks one column uniformly at random; returns NO_COLUMN for an empty list.
int pickRandomColumn(const std::vector<int>& columns, std::mt19937& rng_engine);

// Builds the engine used for tie-breaks. seed == 0 draws from std::random_device.
std::mt19937 makeRngEngine(unsigned int seed);

#endif // UTILS_HPP
