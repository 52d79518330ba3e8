/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_COORD_HPP
#define TILE_COORD_HPP

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <ostream>

namespace Formicary {

/**
 * @brief Integer tile coordinate, y grows downward (row 0 is the sky edge)
 */
struct TileCoord {
    int32_t x{0};
    int32_t y{0};

    constexpr TileCoord() = default;
    constexpr TileCoord(int32_t px, int32_t py) : x(px), y(py) {}

    constexpr TileCoord operator+(const TileCoord& other) const {
        return TileCoord(x + other.x, y + other.y);
    }
    constexpr TileCoord operator-(const TileCoord& other) const {
        return TileCoord(x - other.x, y - other.y);
    }
    constexpr bool operator==(const TileCoord& other) const {
        return x == other.x && y == other.y;
    }
    constexpr bool operator!=(const TileCoord& other) const { return !(*this == other); }

    [[nodiscard]] constexpr bool isZero() const noexcept { return x == 0 && y == 0; }
};

/// Unit step between neighbouring tiles
using TileOffset = TileCoord;

[[nodiscard]] inline int32_t manhattanDistance(const TileCoord& a, const TileCoord& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

[[nodiscard]] inline int32_t chebyshevDistance(const TileCoord& a, const TileCoord& b) {
    int32_t dx = std::abs(a.x - b.x);
    int32_t dy = std::abs(a.y - b.y);
    return dx > dy ? dx : dy;
}

[[nodiscard]] constexpr int32_t signum(int32_t v) {
    return (v > 0) - (v < 0);
}

inline std::ostream& operator<<(std::ostream& os, const TileCoord& coord) {
    return os << "(" << coord.x << ", " << coord.y << ")";
}

} // namespace Formicary

namespace std {
template<>
struct hash<Formicary::TileCoord> {
    size_t operator()(const Formicary::TileCoord& coord) const noexcept {
        return hash<int64_t>{}((static_cast<int64_t>(coord.x) << 32) ^
                               static_cast<uint32_t>(coord.y));
    }
};
} // namespace std

#endif // TILE_COORD_HPP
