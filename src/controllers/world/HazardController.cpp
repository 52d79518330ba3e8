/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/HazardController.hpp"
#include "core/Logger.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "utils/RandomSource.hpp"
#include "world/TerrainSurface.hpp"
#include <algorithm>
#include <array>

using Formicary::TileCoord;
using Formicary::TileKind;
using Formicary::TileOffset;

namespace {

constexpr std::array<TileOffset, 8> SURROUNDING{{
    {-1, -1}, {0, -1}, {1, -1}, {-1, 0}, {1, 0}, {-1, 1}, {0, 1}, {1, 1}
}};

constexpr std::array<TileOffset, 4> CARDINAL{{
    {-1, 0}, {1, 0}, {0, -1}, {0, 1}
}};

} // anonymous namespace

uint8_t HazardController::collapseChance(uint8_t openNeighbours, bool dense,
                                         const Formicary::HazardSettings& settings)
{
    uint8_t bonus = dense ? settings.denseStabilityBonus : 0;
    uint8_t effective = openNeighbours > bonus ? static_cast<uint8_t>(openNeighbours - bonus) : 0;

    switch (effective) {
    case 0:
    case 1:
    case 2:
        return 0;
    case 3:
        return settings.collapseChance3;
    case 4:
        return settings.collapseChance4;
    case 5:
        return settings.collapseChance5;
    default:
        return settings.collapseChance6Plus;
    }
}

bool HazardController::isCollapseCandidate(const Formicary::ITerrainSurface& terrain, TileCoord tile)
{
    if (!terrain.isDiggable(tile.x, tile.y)) {
        return false;
    }
    // Tunnel walls are held up by the ants that dug them
    for (const TileOffset& dir : CARDINAL) {
        if (terrain.get(tile.x + dir.x, tile.y + dir.y) == TileKind::Tunnel) {
            return false;
        }
    }
    return Formicary::isHollowKind(terrain.get(tile.x, tile.y + 1));
}

uint8_t HazardController::countOpenNeighbours(const Formicary::ITerrainSurface& terrain, TileCoord tile)
{
    uint8_t open = 0;
    for (const TileOffset& dir : SURROUNDING) {
        if (Formicary::isHollowKind(terrain.get(tile.x + dir.x, tile.y + dir.y))) {
            ++open;
        }
    }
    return open;
}

size_t HazardController::processCollapses(SimContext& ctx)
{
    Formicary::ITerrainSurface& terrain = ctx.terrain;
    const int32_t width = terrain.width();
    const int32_t height = terrain.height();

    m_collapses.clear();
    m_landings.clear();
    m_commands.clear();

    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            TileCoord tile{x, y};
            if (!isCollapseCandidate(terrain, tile)) {
                continue;
            }
            bool dense = terrain.get(x, y) == TileKind::DenseSoil;
            uint8_t chance = collapseChance(countOpenNeighbours(terrain, tile), dense, ctx.config.hazard);
            if (chance > 0 && ctx.rng.nextByte() < chance) {
                m_collapses.push_back(tile);
            }
        }
    }

    for (const TileCoord& origin : m_collapses) {
        TileKind material = terrain.get(origin.x, origin.y);
        // An earlier collapse this scan may have moved it already
        if (!Formicary::isDiggableKind(material)) {
            continue;
        }

        int32_t landY = origin.y;
        while (landY + 1 < height && terrain.get(origin.x, landY + 1) == TileKind::Open) {
            ++landY;
        }
        if (landY == origin.y) {
            continue;
        }

        terrain.set(origin.x, origin.y, TileKind::Open);
        terrain.set(origin.x, landY, material);
        m_landings.push_back({origin.x, landY});
    }

    if (m_landings.empty()) {
        return 0;
    }

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive()) {
            continue;
        }
        if (std::find(m_landings.begin(), m_landings.end(), agent.position) != m_landings.end()) {
            m_commands.push(AgentCommand::Tombstone{agent.handle});
        }
    }
    size_t crushed = m_commands.apply(ctx.agents);

    HAZARD_INFO("Tick " + std::to_string(ctx.tick) + ": " + std::to_string(m_landings.size()) +
                " cave-ins, " + std::to_string(crushed) + " agents crushed");
    return m_landings.size();
}
