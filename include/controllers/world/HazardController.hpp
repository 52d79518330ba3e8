/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HAZARD_CONTROLLER_HPP
#define HAZARD_CONTROLLER_HPP

/**
 * @file HazardController.hpp
 * @brief Structural collapse of unsupported soil
 *
 * HazardController handles:
 * - Finding soil tiles hanging over open space with no tunnel beside them
 * - Rolling each against a collapse table keyed on surrounding open tiles
 * - Dropping collapsed material straight down through open air
 * - Crushing any agent on the landing tile
 *
 * Candidates are gathered against the terrain as it stood at the start of
 * the scan; collapses then apply in scan order.
 */

#include "controllers/ControllerBase.hpp"
#include "core/SimConfig.hpp"
#include "managers/AgentCommandBuffer.hpp"
#include "utils/TileCoord.hpp"
#include <vector>

struct SimContext;

namespace Formicary {
class ITerrainSurface;
}

class HazardController : public ControllerBase
{
public:
    HazardController() = default;
    ~HazardController() override = default;

    HazardController(HazardController&&) noexcept = default;
    HazardController& operator=(HazardController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "HazardController"; }

    /**
     * @brief Scans the whole grid for cave-ins
     * @return Number of tiles that fell
     * @note Caller gates this on the cave-in interval
     */
    size_t processCollapses(SimContext& ctx);

    /**
     * @brief Byte chance that a tile collapses this scan
     * @param openNeighbours Open or tunnel tiles among the 8 neighbours
     * @param dense Whether the tile is dense soil
     */
    [[nodiscard]] static uint8_t collapseChance(uint8_t openNeighbours, bool dense,
                                                const Formicary::HazardSettings& settings);

    /// Soil or dense soil with hollow space directly below and no tunnel beside it
    [[nodiscard]] static bool isCollapseCandidate(const Formicary::ITerrainSurface& terrain,
                                                  Formicary::TileCoord tile);

    [[nodiscard]] static uint8_t countOpenNeighbours(const Formicary::ITerrainSurface& terrain,
                                                     Formicary::TileCoord tile);

private:
    AgentCommandBuffer m_commands;
    std::vector<Formicary::TileCoord> m_collapses;
    std::vector<Formicary::TileCoord> m_landings;
};

#endif // HAZARD_CONTROLLER_HPP
