#pragma once

#include <random>

/// Process-wide generator used for every trial shuffle
inline std::mt19937& shuffleEngine() {
    static std::mt19937 g(std::random_device{}());
    return g;
}

/// Reseeds the shuffle generator, e.g. with the subject number, so sequences can be regenerated
inline void seedShuffleEngine(unsigned int seed) {
    shuffleEngine().seed(seed);
}
