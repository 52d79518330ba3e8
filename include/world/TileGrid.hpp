/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_GRID_HPP
#define TILE_GRID_HPP

#include "world/TerrainSurface.hpp"
#include <vector>

namespace Formicary {

/**
 * @brief Dense in-memory terrain, row-major
 */
class TileGrid final : public ITerrainSurface {
public:
    TileGrid(int32_t width, int32_t height, TileKind fill = TileKind::Open);

    /**
     * @brief Layered world: open sky, a surface row, soil, dense soil, bedrock
     * @param surfaceRow Row holding the walkable Surface tiles
     * @param denseRow First row of DenseSoil
     * @param bedrockRow First row of Solid
     */
    static TileGrid layered(int32_t width, int32_t height, int32_t surfaceRow,
                            int32_t denseRow, int32_t bedrockRow);

    int32_t width() const override { return m_width; }
    int32_t height() const override { return m_height; }

    TileKind get(int32_t x, int32_t y) const override;
    void set(int32_t x, int32_t y, TileKind kind) override;

    /// Fills an inclusive rectangle, clipped to the grid
    void fillRect(int32_t x0, int32_t y0, int32_t x1, int32_t y1, TileKind kind);

    size_t countKind(TileKind kind) const;

private:
    int32_t m_width;
    int32_t m_height;
    std::vector<TileKind> m_tiles;
};

} // namespace Formicary

#endif // TILE_GRID_HPP
