/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "spatial/SpatialGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Formicary {

SpatialGrid::SpatialGrid(int32_t worldWidth, int32_t worldHeight, int32_t cellSize)
    : m_cellSize(cellSize > 0 ? cellSize : 8)
    , m_cols(std::max(worldWidth, 0) / m_cellSize + 1)
    , m_rows(std::max(worldHeight, 0) / m_cellSize + 1)
    , m_cells(static_cast<size_t>(m_cols) * static_cast<size_t>(m_rows)) {
    if (cellSize <= 0) {
        SPATIAL_WARN("Non-positive cell size " + std::to_string(cellSize) + ", using 8");
    }
}

void SpatialGrid::clear() {
    for (auto& cell : m_cells) {
        cell.clear();
    }
    m_count = 0;
}

void SpatialGrid::insert(AgentHandle agent, TileCoord position, uint8_t colonyId) {
    if (position.x < 0 || position.y < 0) {
        return;
    }
    size_t index;
    if (!cellIndex(position.x / m_cellSize, position.y / m_cellSize, index)) {
        return;
    }
    m_cells[index].push_back(SpatialEntry{agent, position, colonyId});
    ++m_count;
}

void SpatialGrid::queryNearby(TileCoord position, NearbyList& out) const {
    out.clear();

    // Floor division so tiles just left of or above 0 map to cell -1
    auto floorDiv = [this](int32_t v) {
        return v >= 0 ? v / m_cellSize : -((-v + m_cellSize - 1) / m_cellSize);
    };
    int32_t cx = floorDiv(position.x);
    int32_t cy = floorDiv(position.y);

    for (int32_t dy = -1; dy <= 1; ++dy) {
        for (int32_t dx = -1; dx <= 1; ++dx) {
            size_t index;
            if (!cellIndex(cx + dx, cy + dy, index)) {
                continue;
            }
            const auto& cell = m_cells[index];
            out.insert(out.end(), cell.begin(), cell.end());
        }
    }
}

bool SpatialGrid::cellIndex(int32_t cx, int32_t cy, size_t& index) const {
    if (cx < 0 || cy < 0 || cx >= m_cols || cy >= m_rows) {
        return false;
    }
    index = static_cast<size_t>(cy) * static_cast<size_t>(m_cols) + static_cast<size_t>(cx);
    return true;
}

} // namespace Formicary
