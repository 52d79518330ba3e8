/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/colony/CombatController.hpp"
#include "core/Logger.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "utils/RandomSource.hpp"
#include "world/PheromoneField.hpp"
#include <algorithm>

using Formicary::PheromoneType;
using Formicary::TileCoord;

uint8_t CombatController::roleStrength(AgentRole role, const Formicary::CombatSettings& settings)
{
    switch (role) {
    case AgentRole::Soldier: return settings.soldierStrength;
    case AgentRole::Worker:  return settings.workerStrength;
    default:                 return settings.otherStrength;
    }
}

uint8_t CombatController::computeDamage(AgentRole role, uint8_t strength, uint8_t roll,
                                        const Formicary::CombatSettings& settings)
{
    uint32_t base = settings.baseDamage;
    if (role == AgentRole::Soldier) {
        base *= 2;
    } else if (role != AgentRole::Worker) {
        base /= 2;
    }

    // Weak hitters can floor at zero here
    uint32_t raw = base + roll + strength / 10u;
    uint32_t damage = raw > settings.damageOffset ? raw - settings.damageOffset : 0u;
    return static_cast<uint8_t>(std::min<uint32_t>(damage, 255u));
}

uint8_t CombatController::rollDamage(SimContext& ctx, const Combatant& attacker) const
{
    const auto& combat = ctx.config.combat;
    uint8_t roll = combat.damageRandomRange > 0
        ? static_cast<uint8_t>(ctx.rng.uniformInt(0, combat.damageRandomRange - 1))
        : 0;
    return computeDamage(attacker.role, attacker.strength, roll, combat);
}

size_t CombatController::updateSoldierStates(SimContext& ctx)
{
    const auto& combat = ctx.config.combat;
    m_commands.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || agent.role() != AgentRole::Soldier) {
            continue;
        }
        float danger = ctx.pheromones.get(agent.position.x, agent.position.y, agent.colonyId,
                                          PheromoneType::Danger);
        bool fighting = agent.behavior.is(BehaviorState::Fighting);

        if (danger > combat.soldierFightDangerThreshold && !fighting) {
            m_commands.push(AgentCommand::Transition{agent.handle, BehaviorState::Fighting});
        } else if (danger < combat.soldierStopFightThreshold && fighting) {
            m_commands.push(AgentCommand::Transition{agent.handle, BehaviorState::Wandering});
        }
    }

    return m_commands.apply(ctx.agents);
}

size_t CombatController::updateFleeStates(SimContext& ctx)
{
    const auto& combat = ctx.config.combat;
    const uint8_t scanned = std::min(combat.maxColoniesScan, ctx.pheromones.colonyCapacity());
    m_commands.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || agent.role() != AgentRole::Worker) {
            continue;
        }

        // Any colony's danger scent means a fight nearby
        float danger = 0.0f;
        for (uint8_t c = 0; c < scanned; ++c) {
            danger = std::max(danger, ctx.pheromones.get(agent.position.x, agent.position.y, c,
                                                         PheromoneType::Danger));
        }

        BehaviorState state = agent.state();
        if (danger > combat.workerFleeDangerThreshold && state != BehaviorState::Fleeing &&
            state != BehaviorState::Carrying) {
            m_commands.push(AgentCommand::Transition{agent.handle, BehaviorState::Fleeing});
        } else if (danger < combat.workerStopFleeThreshold && state == BehaviorState::Fleeing) {
            m_commands.push(AgentCommand::Transition{agent.handle, BehaviorState::Wandering});
        }
    }

    return m_commands.apply(ctx.agents);
}

size_t CombatController::resolveCombat(SimContext& ctx)
{
    const auto& combat = ctx.config.combat;

    m_commands.clear();
    m_combatants.clear();
    m_combatantIndex.clear();
    m_foughtPairs.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || !AgentTraits::isCombatant(agent.role())) {
            continue;
        }
        m_combatantIndex.emplace(agent.handle, m_combatants.size());
        m_combatants.push_back({agent.handle, agent.position, agent.colonyId, agent.role(),
                                roleStrength(agent.role(), combat)});
    }

    std::vector<std::pair<TileCoord, uint8_t>> dangerMarks;

    for (const Combatant& a : m_combatants) {
        ctx.spatial.queryNearby(a.position, m_nearby);

        for (const Formicary::SpatialEntry& entry : m_nearby) {
            if (entry.colonyId == a.colonyId) {
                continue;
            }
            auto found = m_combatantIndex.find(entry.agent);
            if (found == m_combatantIndex.end()) {
                continue;
            }
            // The index holds start-of-tick positions, adjacency uses current ones
            const Combatant& b = m_combatants[found->second];
            if (Formicary::chebyshevDistance(a.position, b.position) > 1) {
                continue;
            }

            auto pair = a.handle < entry.agent ? std::make_pair(a.handle, entry.agent)
                                               : std::make_pair(entry.agent, a.handle);
            if (!m_foughtPairs.insert(pair).second) {
                continue;
            }

            uint8_t damageToB = rollDamage(ctx, a);
            uint8_t damageToA = rollDamage(ctx, b);

            m_commands.push(AgentCommand::Damage{b.handle, damageToB, combat.defaultHealth,
                                                 combat.defaultFighterStrength});
            m_commands.push(AgentCommand::Damage{a.handle, damageToA, combat.defaultHealth,
                                                 combat.defaultFighterStrength});

            dangerMarks.emplace_back(a.position, a.colonyId);
            dangerMarks.emplace_back(b.position, b.colonyId);
        }
    }

    m_commands.apply(ctx.agents);

    for (const auto& [pos, colony] : dangerMarks) {
        ctx.pheromones.deposit(pos.x, pos.y, colony, PheromoneType::Danger, combat.dangerDeposit);
    }

    if (!m_foughtPairs.empty()) {
        COMBAT_DEBUG("Tick " + std::to_string(ctx.tick) + ": " + std::to_string(m_foughtPairs.size()) +
                     " fights");
    }
    return m_foughtPairs.size();
}
