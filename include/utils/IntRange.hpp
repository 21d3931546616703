/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INT_RANGE_HPP
#define INT_RANGE_HPP

#include "utils/RandomSource.hpp"
#include <ostream>

namespace DelveEngine {

/**
 * @brief Inclusive integer range [min, max]
 *
 * Used for spawn counts, stat ranges, loot quantities and attack values.
 */
struct IntRange {
    int min{0};
    int max{0};

    constexpr IntRange() = default;
    constexpr IntRange(int lo, int hi) : min(lo), max(hi) {}

    static constexpr IntRange exactly(int value) { return {value, value}; }

    constexpr bool isValid() const { return min <= max; }
    constexpr bool contains(int value) const { return value >= min && value <= max; }

    int roll(RandomSource& rng) const { return rng.intInRange(min, max); }

    constexpr bool operator==(const IntRange& other) const {
        return min == other.min && max == other.max;
    }
    constexpr bool operator!=(const IntRange& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const IntRange& range) {
    return os << range.min << "..=" << range.max;
}

} // namespace DelveEngine

#endif // INT_RANGE_HPP
