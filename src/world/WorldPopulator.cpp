/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/WorldPopulator.hpp"
#include "core/Logger.hpp"
#include "managers/AgentDataManager.hpp"
#include "managers/ColonyRegistry.hpp"
#include "utils/RandomSource.hpp"
#include "world/TerrainSurface.hpp"
#include "world/WaterGrid.hpp"
#include <algorithm>

namespace Formicary {

namespace {

constexpr int32_t COLONY_EDGE_MARGIN = 10;
constexpr int32_t COLONY_SITE_ATTEMPTS = 100;
constexpr int32_t APHID_MIN_DEPTH = 3;
constexpr int32_t APHID_MAX_DEPTH = 10;
constexpr int32_t SPRING_MIN_DEPTH = 3;
constexpr int32_t SPRING_MAX_DEPTH = 7;

} // anonymous namespace

WorldPopulator::WorldPopulator(const SimConfig& config, IRandomSource& rng)
    : m_config(config), m_rng(rng) {}

std::optional<int32_t> WorldPopulator::surfaceRow(const ITerrainSurface& terrain, int32_t x) {
    for (int32_t y = 0; y < terrain.height(); ++y) {
        if (terrain.get(x, y) == TileKind::Surface) {
            return y;
        }
    }
    return std::nullopt;
}

std::optional<int32_t> WorldPopulator::groundRow(const ITerrainSurface& terrain, int32_t x) {
    for (int32_t y = 0; y < terrain.height(); ++y) {
        if (!terrain.isPassable(x, y)) {
            return y;
        }
    }
    return std::nullopt;
}

bool WorldPopulator::populate(ITerrainSurface& terrain, AgentDataManager& agents, ColonyRegistry& colonies,
                              WaterGrid& water) {
    size_t founded = placeColonies(terrain, agents, colonies);
    if (founded == 0) {
        POPULATE_ERROR("No surface site available for any colony");
        return false;
    }

    size_t food = placeFoodSources(terrain, agents);
    size_t aphids = placeAphids(terrain, agents);
    size_t springs = placeWaterSources(terrain, water);

    POPULATE_INFO("World populated: " + std::to_string(founded) + " colonies, " +
                  std::to_string(agents.getAgentCount()) + " agents, " + std::to_string(food) +
                  " food sources, " + std::to_string(aphids) + " aphids, " + std::to_string(springs) +
                  " springs");
    return true;
}

std::optional<TileCoord> WorldPopulator::findColonySite(const ITerrainSurface& terrain,
                                                        const std::vector<TileCoord>& taken) {
    const int32_t minX = COLONY_EDGE_MARGIN;
    const int32_t maxX = terrain.width() - COLONY_EDGE_MARGIN;
    if (maxX <= minX) {
        return std::nullopt;
    }

    for (int32_t attempt = 0; attempt < COLONY_SITE_ATTEMPTS; ++attempt) {
        int32_t x = m_rng.uniformInt(minX, maxX - 1);
        auto y = surfaceRow(terrain, x);
        if (!y) {
            continue;
        }
        TileCoord site{x, *y};
        bool crowded = std::any_of(taken.begin(), taken.end(), [&](const TileCoord& other) {
            return manhattanDistance(site, other) < m_config.spawn.minColonyDistance;
        });
        if (!crowded) {
            return site;
        }
    }

    // Give up on spacing, take any free surface tile
    for (int32_t x = minX; x < maxX; ++x) {
        auto y = surfaceRow(terrain, x);
        if (!y) {
            continue;
        }
        TileCoord site{x, *y};
        if (std::find(taken.begin(), taken.end(), site) == taken.end()) {
            POPULATE_WARN("Colony spacing relaxed, site at x=" + std::to_string(x));
            return site;
        }
    }
    return std::nullopt;
}

size_t WorldPopulator::placeColonies(const ITerrainSurface& terrain, AgentDataManager& agents,
                                     ColonyRegistry& colonies) {
    const auto& lifecycle = m_config.lifecycle;
    std::vector<TileCoord> homes;

    for (uint8_t i = 0; i < m_config.spawn.numColonies; ++i) {
        auto site = findColonySite(terrain, homes);
        if (!site) {
            POPULATE_WARN("Only " + std::to_string(homes.size()) + " of " +
                          std::to_string(m_config.spawn.numColonies) + " colonies fit");
            break;
        }

        uint8_t id = colonies.addColony(*site, m_config.colony.initialFood);
        if (id >= colonies.capacity()) {
            break;
        }
        homes.push_back(*site);

        agents.spawnAgent(*site, id, AgentRole::Queen, AgeCounter{0, lifecycle.queenLifespan});

        for (uint32_t w = 0; w < m_config.spawn.initialWorkers; ++w) {
            TileCoord spot{site->x + static_cast<int32_t>(w % 5) - 2, site->y + static_cast<int32_t>(w / 5)};
            if (!terrain.isPassable(spot.x, spot.y)) {
                spot = *site;
            }
            agents.spawnAgent(spot, id, AgentRole::Worker, AgeCounter{0, lifecycle.workerLifespan});
        }
    }
    return homes.size();
}

size_t WorldPopulator::placeFoodSources(const ITerrainSurface& terrain, AgentDataManager& agents) {
    const auto& food = m_config.food;
    const uint32_t wanted = food.numSources;
    size_t placed = 0;

    for (uint32_t attempt = 0; placed < wanted && attempt < wanted * 10 && terrain.width() > 0; ++attempt) {
        int32_t x = m_rng.uniformInt(0, terrain.width() - 1);
        auto ground = groundRow(terrain, x);
        if (!ground || *ground < 2) {
            continue;
        }
        // Food sits on the last passable tile above the ground
        int32_t y = *ground - 1;
        if (terrain.isPassable(x, y)) {
            agents.addFoodSource({x, y}, food.initialAmount, food.regrowRate);
            ++placed;
        }
    }

    if (placed < wanted) {
        POPULATE_WARN("Placed " + std::to_string(placed) + " of " + std::to_string(wanted) + " food sources");
    }
    return placed;
}

size_t WorldPopulator::placeAphids(const ITerrainSurface& terrain, AgentDataManager& agents) {
    const uint32_t wanted = m_config.spawn.numAphids;
    size_t placed = 0;

    for (uint32_t attempt = 0; placed < wanted && attempt < wanted * 20 && terrain.width() > 0; ++attempt) {
        int32_t x = m_rng.uniformInt(0, terrain.width() - 1);
        auto ground = groundRow(terrain, x);
        if (!ground) {
            continue;
        }
        int32_t y = *ground + m_rng.uniformInt(APHID_MIN_DEPTH, APHID_MAX_DEPTH);
        if (y < terrain.height() && terrain.isPassable(x, y)) {
            agents.addAphid({x, y}, m_config.spawn.aphidFoodRate);
            ++placed;
        }
    }

    if (placed < wanted) {
        POPULATE_WARN("Placed " + std::to_string(placed) + " of " + std::to_string(wanted) +
                      " aphids, not enough underground caves");
    }
    return placed;
}

size_t WorldPopulator::placeWaterSources(const ITerrainSurface& terrain, WaterGrid& water) {
    const uint32_t wanted = m_config.water.numSources;
    const int32_t top = terrain.height() / 2;
    size_t placed = 0;

    if (terrain.width() <= 0 || terrain.height() <= top) {
        return 0;
    }

    for (uint32_t attempt = 0; placed < wanted && attempt < wanted * 20; ++attempt) {
        int32_t x = m_rng.uniformInt(0, terrain.width() - 1);
        int32_t y = m_rng.uniformInt(top, terrain.height() - 1);
        if (terrain.isPassable(x, y)) {
            water.addWater(x, y, static_cast<uint8_t>(m_rng.uniformInt(SPRING_MIN_DEPTH, SPRING_MAX_DEPTH)));
            ++placed;
        }
    }

    if (placed < wanted) {
        POPULATE_WARN("Placed " + std::to_string(placed) + " of " + std::to_string(wanted) + " water sources");
    }
    return placed;
}

} // namespace Formicary
