/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHEROMONE_CONTROLLER_HPP
#define PHEROMONE_CONTROLLER_HPP

/**
 * @file PheromoneController.hpp
 * @brief Per-tick pheromone field maintenance and agent scent marking
 *
 * Runs decay, then diffusion, then lays fresh scent so new deposits are not
 * smeared before agents can read them next tick. Carrying workers mark food
 * trails; wandering, returning and digging agents mark home scent that fades
 * out with distance from the nest.
 */

#include "controllers/ControllerBase.hpp"
#include "utils/TileCoord.hpp"

struct SimContext;

class PheromoneController : public ControllerBase
{
public:
    PheromoneController() = default;
    ~PheromoneController() override = default;

    PheromoneController(PheromoneController&&) noexcept = default;
    PheromoneController& operator=(PheromoneController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "PheromoneController"; }

    /// Decay, diffuse, deposit
    void update(SimContext& ctx);

    /// Scent laid by every live agent at its current tile
    void depositFromAgents(SimContext& ctx);

    /**
     * @brief Nest proximity weight, 1 at home falling linearly to 0 at radius
     */
    [[nodiscard]] static float proximity(Formicary::TileCoord pos, Formicary::TileCoord home, int32_t radius);
};

#endif // PHEROMONE_CONTROLLER_HPP
