/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TERRAIN_SURFACE_HPP
#define TERRAIN_SURFACE_HPP

#include <cstdint>
#include <ostream>

namespace Formicary {

enum class TileKind : uint8_t {
    Open = 0,
    Tunnel,
    Soil,
    DenseSoil,
    Solid,
    Surface
};

inline std::ostream& operator<<(std::ostream& os, TileKind kind) {
    switch (kind) {
    case TileKind::Open: return os << "Open";
    case TileKind::Tunnel: return os << "Tunnel";
    case TileKind::Soil: return os << "Soil";
    case TileKind::DenseSoil: return os << "DenseSoil";
    case TileKind::Solid: return os << "Solid";
    case TileKind::Surface: return os << "Surface";
    }
    return os << "Unknown";
}

[[nodiscard]] constexpr bool isPassableKind(TileKind kind) {
    return kind == TileKind::Open || kind == TileKind::Tunnel || kind == TileKind::Surface;
}

[[nodiscard]] constexpr bool isDiggableKind(TileKind kind) {
    return kind == TileKind::Soil || kind == TileKind::DenseSoil;
}

/// Open air or a dug tunnel, the tiles loose material can fall into
[[nodiscard]] constexpr bool isHollowKind(TileKind kind) {
    return kind == TileKind::Open || kind == TileKind::Tunnel;
}

/**
 * @brief Read/write tile grid the simulation runs on
 *
 * World generation lives outside the core. Out-of-bounds coordinates read as
 * Solid and writes to them are ignored.
 */
class ITerrainSurface {
public:
    virtual ~ITerrainSurface() = default;

    virtual int32_t width() const = 0;
    virtual int32_t height() const = 0;

    virtual TileKind get(int32_t x, int32_t y) const = 0;
    virtual void set(int32_t x, int32_t y, TileKind kind) = 0;

    bool inBounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < width() && y < height();
    }
    bool isPassable(int32_t x, int32_t y) const { return isPassableKind(get(x, y)); }
    bool isDiggable(int32_t x, int32_t y) const { return isDiggableKind(get(x, y)); }
};

} // namespace Formicary

#endif // TERRAIN_SURFACE_HPP
