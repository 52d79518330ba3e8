/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DIG_CONTROLLER_HPP
#define DIG_CONTROLLER_HPP

/**
 * @file DigController.hpp
 * @brief Worker task selection and tunnel excavation
 *
 * DigController handles:
 * - Worker state decisions (wander, dig, return, follow food trails)
 * - Turning soil into tunnel below and beside digging workers
 * - Hardening the walls around a fresh tunnel into dense soil
 *
 * Decisions are taken in the decision phase, excavation in the action
 * phase after movement. Terrain writes are gathered first and applied
 * once every digging worker has been visited.
 */

#include "controllers/ControllerBase.hpp"
#include "managers/AgentCommandBuffer.hpp"
#include "utils/TileCoord.hpp"
#include <vector>

struct SimContext;

namespace Formicary {
class ITerrainSurface;
}

class DigController : public ControllerBase
{
public:
    DigController() = default;
    ~DigController() override = default;

    DigController(DigController&&) noexcept = default;
    DigController& operator=(DigController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "DigController"; }

    // --- Decision phase ---

    /**
     * @brief Applies the worker decision table to every live worker
     * @return Number of workers whose state changed
     */
    size_t updateWorkerStates(SimContext& ctx);

    // --- Action phase ---

    /**
     * @brief Lets each digging worker try to excavate one tile
     * @return Number of tiles turned into tunnel
     */
    size_t applyDigging(SimContext& ctx);

    // --- Terrain queries ---

    /// Any of down, down-left, down-right, left, right is diggable
    [[nodiscard]] static bool canDig(const Formicary::ITerrainSurface& terrain, Formicary::TileCoord pos);

    /// Solid footing below, or standing on the surface
    [[nodiscard]] static bool onGround(const Formicary::ITerrainSurface& terrain, Formicary::TileCoord pos);

private:
    [[nodiscard]] BehaviorState decideWorkerState(SimContext& ctx, const Agent& worker) const;

    AgentCommandBuffer m_commands;
    std::vector<Formicary::TileCoord> m_digTargets;
};

#endif // DIG_CONTROLLER_HPP
