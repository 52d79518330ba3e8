/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FORAGING_CONTROLLER_HPP
#define FORAGING_CONTROLLER_HPP

/**
 * @file ForagingController.hpp
 * @brief Food pickup, delivery and food source regrowth
 *
 * ForagingController handles:
 * - Workers standing on a food source picking up a load
 * - Loaded workers near home delivering into colony stores
 * - Periodic regrowth of depleted food sources
 */

#include "controllers/ControllerBase.hpp"
#include "managers/AgentCommandBuffer.hpp"
#include "utils/TileCoord.hpp"
#include <unordered_map>

struct SimContext;

class ForagingController : public ControllerBase
{
public:
    ForagingController() = default;
    ~ForagingController() override = default;

    ForagingController(ForagingController&&) noexcept = default;
    ForagingController& operator=(ForagingController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "ForagingController"; }

    /**
     * @brief Runs pickups and deliveries for this tick
     * @return Number of pickups plus deliveries
     */
    size_t updateForaging(SimContext& ctx);

    /**
     * @brief Adds the regrow rate to every source below its spawn amount
     * @note Caller gates this on the regrow interval
     */
    void regrowFood(SimContext& ctx);

private:
    AgentCommandBuffer m_commands;
    std::unordered_map<Formicary::TileCoord, size_t> m_sourceAt;
};

#endif // FORAGING_CONTROLLER_HPP
