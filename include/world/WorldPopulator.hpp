/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_POPULATOR_HPP
#define WORLD_POPULATOR_HPP

#include "core/SimConfig.hpp"
#include "utils/TileCoord.hpp"
#include <cstddef>
#include <optional>
#include <vector>

class AgentDataManager;
class ColonyRegistry;

namespace Formicary {

class IRandomSource;
class ITerrainSurface;
class WaterGrid;

/**
 * @brief One-shot placement of colonies, food, aphids and springs
 *
 * Runs once before the first tick. Every placement is best effort: a world
 * without room for all requested items gets as many as fit and a warning.
 */
class WorldPopulator {
public:
    WorldPopulator(const SimConfig& config, IRandomSource& rng);

    /**
     * @brief Places everything the config asks for
     * @return false if not a single colony could be founded
     */
    bool populate(ITerrainSurface& terrain, AgentDataManager& agents, ColonyRegistry& colonies,
                  WaterGrid& water);

    /// Founds colonies with a queen and starting workers each
    size_t placeColonies(const ITerrainSurface& terrain, AgentDataManager& agents, ColonyRegistry& colonies);

    size_t placeFoodSources(const ITerrainSurface& terrain, AgentDataManager& agents);
    size_t placeAphids(const ITerrainSurface& terrain, AgentDataManager& agents);
    size_t placeWaterSources(const ITerrainSurface& terrain, WaterGrid& water);

    /// Topmost Surface tile in a column
    [[nodiscard]] static std::optional<int32_t> surfaceRow(const ITerrainSurface& terrain, int32_t x);

    /// Topmost impassable tile in a column
    [[nodiscard]] static std::optional<int32_t> groundRow(const ITerrainSurface& terrain, int32_t x);

private:
    [[nodiscard]] std::optional<TileCoord> findColonySite(const ITerrainSurface& terrain,
                                                          const std::vector<TileCoord>& taken);

    const SimConfig& m_config;
    IRandomSource& m_rng;
};

} // namespace Formicary

#endif // WORLD_POPULATOR_HPP
