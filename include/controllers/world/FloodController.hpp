/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOOD_CONTROLLER_HPP
#define FLOOD_CONTROLLER_HPP

/**
 * @file FloodController.hpp
 * @brief How agents react to standing water
 *
 * FloodController handles:
 * - Submersion counting and drowning in dangerous water
 * - Sending agents in rising water back up towards the surface
 * - Returning soldiers and queens to normal duty once they surface
 *
 * The water itself is simulated by WaterGrid; this controller only reads
 * depths.
 */

#include "controllers/ControllerBase.hpp"
#include "core/SimConfig.hpp"
#include "managers/AgentCommandBuffer.hpp"
#include <optional>

struct SimContext;

class FloodController : public ControllerBase
{
public:
    FloodController() = default;
    ~FloodController() override = default;

    FloodController(FloodController&&) noexcept = default;
    FloodController& operator=(FloodController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "FloodController"; }

    /**
     * @brief Advances submersion counters and drowns whoever hit their limit
     * @return Number of agents drowned
     */
    size_t processDrowning(SimContext& ctx);

    /// Agents in water at or above the flee depth start climbing
    size_t fleeFlood(SimContext& ctx);

    /// Returning soldiers and queens standing on the surface resume Wandering and Idle
    size_t updateSurfacing(SimContext& ctx);

    /**
     * @brief Consecutive ticks an agent survives at a depth
     * @return nullopt for depths that never drown
     */
    [[nodiscard]] static std::optional<uint32_t> drownThreshold(uint8_t depth,
                                                                const Formicary::WaterSettings& settings);

private:
    AgentCommandBuffer m_commands;
};

#endif // FLOOD_CONTROLLER_HPP
