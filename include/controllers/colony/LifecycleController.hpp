/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIFECYCLE_CONTROLLER_HPP
#define LIFECYCLE_CONTROLLER_HPP

/**
 * @file LifecycleController.hpp
 * @brief Ageing, brood development, egg laying and colony upkeep
 *
 * LifecycleController handles:
 * - Ageing every agent that carries an age counter
 * - Hatching eggs into larvae and maturing larvae into workers or soldiers
 * - Natural death once an adult outlives its lifespan
 * - Queens laying eggs on the lay interval when the colony can pay
 * - Periodic food upkeep per colony
 *
 * Within one tick the ageing pass runs first, so brood that reaches its
 * limit this tick is promoted this tick.
 */

#include "controllers/ControllerBase.hpp"
#include "managers/AgentCommandBuffer.hpp"
#include <vector>

struct SimContext;

class LifecycleController : public ControllerBase
{
public:
    LifecycleController() = default;
    ~LifecycleController() override = default;

    LifecycleController(LifecycleController&&) noexcept = default;
    LifecycleController& operator=(LifecycleController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "LifecycleController"; }

    /**
     * @brief Runs ageing, laying and upkeep for this tick
     *
     * Laying and upkeep check their own intervals against ctx.tick.
     */
    void update(SimContext& ctx);

    // --- Individual stages, exposed for tests ---

    /// Ages everyone, then promotes or retires whoever crossed a limit
    void ageAgents(SimContext& ctx);

    /// @return Number of eggs laid
    size_t layEggs(SimContext& ctx);

    /// Charges each colony for its larvae and adults
    void consumeFood(SimContext& ctx);

private:
    AgentCommandBuffer m_commands;
    std::vector<uint32_t> m_upkeep;
};

#endif // LIFECYCLE_CONTROLLER_HPP
