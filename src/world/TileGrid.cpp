/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/TileGrid.hpp"
#include <algorithm>

namespace Formicary {

TileGrid::TileGrid(int32_t width, int32_t height, TileKind fill)
    : m_width(std::max(width, 0))
    , m_height(std::max(height, 0))
    , m_tiles(static_cast<size_t>(m_width) * static_cast<size_t>(m_height), fill) {}

TileGrid TileGrid::layered(int32_t width, int32_t height, int32_t surfaceRow,
                           int32_t denseRow, int32_t bedrockRow) {
    TileGrid grid(width, height, TileKind::Open);
    grid.fillRect(0, surfaceRow, width - 1, surfaceRow, TileKind::Surface);
    grid.fillRect(0, surfaceRow + 1, width - 1, denseRow - 1, TileKind::Soil);
    grid.fillRect(0, denseRow, width - 1, bedrockRow - 1, TileKind::DenseSoil);
    grid.fillRect(0, bedrockRow, width - 1, height - 1, TileKind::Solid);
    return grid;
}

TileKind TileGrid::get(int32_t x, int32_t y) const {
    if (!inBounds(x, y)) {
        return TileKind::Solid;
    }
    return m_tiles[static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)];
}

void TileGrid::set(int32_t x, int32_t y, TileKind kind) {
    if (!inBounds(x, y)) {
        return;
    }
    m_tiles[static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)] = kind;
}

void TileGrid::fillRect(int32_t x0, int32_t y0, int32_t x1, int32_t y1, TileKind kind) {
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min(x1, m_width - 1);
    y1 = std::min(y1, m_height - 1);
    for (int32_t y = y0; y <= y1; ++y) {
        for (int32_t x = x0; x <= x1; ++x) {
            set(x, y, kind);
        }
    }
}

size_t TileGrid::countKind(TileKind kind) const {
    return static_cast<size_t>(std::count(m_tiles.begin(), m_tiles.end(), kind));
}

} // namespace Formicary
