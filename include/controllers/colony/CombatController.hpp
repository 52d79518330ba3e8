/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_CONTROLLER_HPP
#define COMBAT_CONTROLLER_HPP

/**
 * @file CombatController.hpp
 * @brief Cross-colony fights and the danger responses around them
 *
 * CombatController handles:
 * - Soldiers switching into and out of Fighting on own-colony danger scent
 * - Workers fleeing strong danger scent from any colony
 * - Resolving one damage exchange per adjacent enemy pair on combat ticks
 * - Marking both fight positions with danger pheromone
 *
 * Pairs are found through the spatial index and filtered to Chebyshev
 * distance 1. Each unordered pair fights once per combat tick no matter
 * which side finds the other first.
 */

#include "controllers/ControllerBase.hpp"
#include "core/SimConfig.hpp"
#include "managers/AgentCommandBuffer.hpp"
#include "spatial/SpatialGrid.hpp"
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

struct SimContext;

class CombatController : public ControllerBase
{
public:
    CombatController() = default;
    ~CombatController() override = default;

    CombatController(CombatController&&) noexcept = default;
    CombatController& operator=(CombatController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "CombatController"; }

    // --- Decision phase ---

    /// Soldiers enter Fighting above the fight threshold and leave it below the stop threshold
    size_t updateSoldierStates(SimContext& ctx);

    /// Workers not already fleeing or carrying flee strong danger, and calm down once it fades
    size_t updateFleeStates(SimContext& ctx);

    // --- Action phase ---

    /**
     * @brief Resolves all adjacent cross-colony fights
     * @return Number of pairs that fought
     * @note Caller gates this on the combat interval
     */
    size_t resolveCombat(SimContext& ctx);

    /**
     * @brief Damage dealt by one combatant
     *
     * Role base (soldiers double, workers single, others half) plus the roll
     * plus a tenth of the strength, minus the fixed offset, floored at zero.
     */
    [[nodiscard]] static uint8_t computeDamage(AgentRole role, uint8_t strength, uint8_t roll,
                                               const Formicary::CombatSettings& settings);

    /// Configured strength for a role
    [[nodiscard]] static uint8_t roleStrength(AgentRole role, const Formicary::CombatSettings& settings);

private:
    struct Combatant {
        AgentHandle handle;
        Formicary::TileCoord position;
        uint8_t colonyId;
        AgentRole role;
        uint8_t strength;
    };

    [[nodiscard]] uint8_t rollDamage(SimContext& ctx, const Combatant& attacker) const;

    AgentCommandBuffer m_commands;
    std::vector<Combatant> m_combatants;
    std::unordered_map<AgentHandle, size_t> m_combatantIndex;
    std::set<std::pair<AgentHandle, AgentHandle>> m_foughtPairs;
    Formicary::NearbyList m_nearby;
};

#endif // COMBAT_CONTROLLER_HPP
