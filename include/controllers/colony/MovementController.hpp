/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVEMENT_CONTROLLER_HPP
#define MOVEMENT_CONTROLLER_HPP

/**
 * @file MovementController.hpp
 * @brief Per-state step selection for every mobile agent
 *
 * MovementController handles:
 * - Random biased-downward walk (Wandering, Idle)
 * - Seeking freshly opened tiles (Digging) and climbing (Returning)
 * - Homing with pheromone fallback (Carrying), trail following (Following)
 * - Danger gradient ascent (Fighting) and descent (Fleeing)
 *
 * Steps are chosen from a read-only view of the world and applied as Move
 * commands once every agent has picked. A step is dropped when its
 * destination is impassable or too deep to wade.
 */

#include "controllers/ControllerBase.hpp"
#include "managers/AgentCommandBuffer.hpp"
#include "utils/TileCoord.hpp"
#include <optional>

struct SimContext;

class MovementController : public ControllerBase
{
public:
    MovementController() = default;
    ~MovementController() override = default;

    MovementController(MovementController&&) noexcept = default;
    MovementController& operator=(MovementController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "MovementController"; }

    /**
     * @brief Picks and applies one step for every live, mobile agent
     * @return Number of agents that moved
     */
    size_t moveAgents(SimContext& ctx);

    /**
     * @brief Whether an agent may step onto the tile
     *
     * Terrain must be passable and the water there shallower than the
     * wading limit.
     */
    [[nodiscard]] static bool canEnter(const SimContext& ctx, Formicary::TileCoord tile);

private:
    [[nodiscard]] std::optional<Formicary::TileOffset> chooseStep(SimContext& ctx, const Agent& agent) const;

    [[nodiscard]] Formicary::TileOffset randomStep(SimContext& ctx) const;
    [[nodiscard]] Formicary::TileOffset digStep(const SimContext& ctx, Formicary::TileCoord pos) const;
    [[nodiscard]] Formicary::TileOffset climbStep(SimContext& ctx, Formicary::TileCoord pos) const;
    [[nodiscard]] Formicary::TileOffset homeStep(SimContext& ctx, const Agent& agent) const;
    [[nodiscard]] Formicary::TileOffset fleeStep(SimContext& ctx, const Agent& agent) const;

    AgentCommandBuffer m_commands;
};

#endif // MOVEMENT_CONTROLLER_HPP
