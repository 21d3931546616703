/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/RandomSource.hpp"
#include <algorithm>
#include <sstream>

namespace DelveEngine {

int RandomSource::intInRange(int minValue, int maxValue) {
    if (maxValue <= minValue) {
        return minValue;
    }
    std::uniform_int_distribution<int> dist(minValue, maxValue);
    return dist(m_engine);
}

size_t RandomSource::index(size_t count) {
    if (count <= 1) {
        return 0;
    }
    std::uniform_int_distribution<size_t> dist(0, count - 1);
    return dist(m_engine);
}

bool RandomSource::chance(double probability) {
    probability = std::clamp(probability, 0.0, 1.0);
    std::bernoulli_distribution dist(probability);
    return dist(m_engine);
}

std::string RandomSource::saveState() const {
    std::ostringstream oss;
    oss << m_engine;
    return oss.str();
}

bool RandomSource::restoreState(const std::string& state) {
    std::istringstream iss(state);
    Engine restored;
    iss >> restored;
    if (iss.fail()) {
        return false;
    }
    m_engine = restored;
    return true;
}

void RandomSource::reseed(uint32_t seed) {
    m_seed = seed;
    m_engine.seed(seed);
}

} // namespace DelveEngine
