/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace DelveEngine {

/**
 * @brief Seedable random number source injected into spawn and combat code
 *
 * Every random decision made while generating a floor or resolving combat
 * goes through one RandomSource, so a fixed seed plus a fixed sequence of
 * calls reproduces the exact same outcome. The engine state can be captured
 * and restored as text for floor snapshots.
 *
 * Not thread-safe; owned by a single FloorState (or by a test).
 */
class RandomSource {
public:
    using Engine = std::mt19937;

    explicit RandomSource(uint32_t seed = 5489u) : m_seed(seed), m_engine(seed) {}

    /**
     * @brief Uniform integer in the inclusive range [minValue, maxValue]
     * @note Returns minValue when the range is empty or inverted
     */
    int intInRange(int minValue, int maxValue);

    /**
     * @brief Uniform index in [0, count)
     * @note count must be > 0
     */
    size_t index(size_t count);

    /**
     * @brief Bernoulli trial that succeeds with the given probability
     * @param probability Clamped to [0, 1]
     */
    bool chance(double probability);

    uint32_t getSeed() const { return m_seed; }

    // Engine state capture for persistence
    std::string saveState() const;
    bool restoreState(const std::string& state);

    void reseed(uint32_t seed);

private:
    uint32_t m_seed;
    Engine m_engine;
};

} // namespace DelveEngine

#endif // RANDOM_SOURCE_HPP
