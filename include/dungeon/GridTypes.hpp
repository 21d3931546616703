/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_TYPES_HPP
#define GRID_TYPES_HPP

#include <cstdint>
#include <ostream>

namespace DelveEngine {

/// Opaque reference to an entity placed on a floor. 0 is never allocated.
using EntityId = uint32_t;
constexpr EntityId INVALID_ENTITY_ID = 0;

struct GridPosition {
    int x{0};
    int y{0};

    constexpr GridPosition() = default;
    constexpr GridPosition(int px, int py) : x(px), y(py) {}

    constexpr bool operator==(const GridPosition& other) const {
        return x == other.x && y == other.y;
    }
    constexpr bool operator!=(const GridPosition& other) const { return !(*this == other); }

    constexpr GridPosition offset(int dx, int dy) const { return {x + dx, y + dy}; }
};

struct GridSize {
    int width{1};
    int height{1};

    constexpr GridSize() = default;
    constexpr GridSize(int w, int h) : width(w), height(h) {}

    static constexpr GridSize single() { return {1, 1}; }

    constexpr bool isValid() const { return width >= 1 && height >= 1; }
    constexpr int cellCount() const { return width * height; }

    constexpr bool operator==(const GridSize& other) const {
        return width == other.width && height == other.height;
    }
    constexpr bool operator!=(const GridSize& other) const { return !(*this == other); }
};

/**
 * @brief Origin plus size; covers [x, x+width) x [y, y+height)
 */
struct Footprint {
    GridPosition origin{};
    GridSize size{};

    // Edges are computed in 64 bits so origins near INT_MAX cannot wrap
    constexpr int64_t endX() const { return static_cast<int64_t>(origin.x) + size.width; }
    constexpr int64_t endY() const { return static_cast<int64_t>(origin.y) + size.height; }

    constexpr bool contains(int cx, int cy) const {
        return cx >= origin.x && cx < endX() && cy >= origin.y && cy < endY();
    }

    constexpr bool overlaps(const Footprint& other) const {
        return origin.x < other.endX() && endX() > other.origin.x &&
               origin.y < other.endY() && endY() > other.origin.y;
    }

    constexpr bool operator==(const Footprint& other) const {
        return origin == other.origin && size == other.size;
    }

    /// Invoke fn(x, y) for every covered cell, row-major
    template <typename Fn> void forEachCell(Fn&& fn) const {
        for (int64_t cy = origin.y; cy < endY(); ++cy) {
            for (int64_t cx = origin.x; cx < endX(); ++cx) {
                fn(static_cast<int>(cx), static_cast<int>(cy));
            }
        }
    }
};

enum class Direction : uint8_t { Up, Down, Left, Right };

constexpr GridPosition step(GridPosition pos, Direction dir) {
    switch (dir) {
        case Direction::Up: return pos.offset(0, -1);
        case Direction::Down: return pos.offset(0, 1);
        case Direction::Left: return pos.offset(-1, 0);
        case Direction::Right: return pos.offset(1, 0);
    }
    return pos;
}

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const GridPosition& pos) {
    return os << "(" << pos.x << ", " << pos.y << ")";
}

inline std::ostream& operator<<(std::ostream& os, const GridSize& size) {
    return os << size.width << "x" << size.height;
}

inline std::ostream& operator<<(std::ostream& os, const Footprint& fp) {
    return os << fp.origin << " " << fp.size;
}

inline std::ostream& operator<<(std::ostream& os, const Direction& dir) {
    switch (dir) {
        case Direction::Up: return os << "Up";
        case Direction::Down: return os << "Down";
        case Direction::Left: return os << "Left";
        case Direction::Right: return os << "Right";
        default: return os << "UNKNOWN";
    }
}

} // namespace DelveEngine

#endif // GRID_TYPES_HPP
