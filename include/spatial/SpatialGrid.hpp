/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_GRID_HPP
#define SPATIAL_GRID_HPP

#include "entities/AgentHandle.hpp"
#include "utils/TileCoord.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <vector>

namespace Formicary {

struct SpatialEntry {
    AgentHandle agent;
    TileCoord position;
    uint8_t colonyId{0};
};

using NearbyList = boost::container::small_vector<SpatialEntry, 32>;

/**
 * @brief Uniform bucket grid over agent positions
 *
 * Rebuilt from scratch each tick, so there is no remove or update. A query
 * returns everything in the 3x3 block of cells around the query cell;
 * callers apply their own exact distance filter.
 */
class SpatialGrid {
public:
    SpatialGrid(int32_t worldWidth, int32_t worldHeight, int32_t cellSize = 8);

    void clear();

    /// Positions outside the world are not indexed
    void insert(AgentHandle agent, TileCoord position, uint8_t colonyId);

    void queryNearby(TileCoord position, NearbyList& out) const;

    [[nodiscard]] int32_t getCellSize() const noexcept { return m_cellSize; }
    [[nodiscard]] size_t size() const noexcept { return m_count; }

private:
    [[nodiscard]] bool cellIndex(int32_t cx, int32_t cy, size_t& index) const;

    int32_t m_cellSize;
    int32_t m_cols;
    int32_t m_rows;
    size_t m_count{0};
    std::vector<std::vector<SpatialEntry>> m_cells;
};

} // namespace Formicary

#endif // SPATIAL_GRID_HPP
