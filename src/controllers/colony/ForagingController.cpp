/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/colony/ForagingController.hpp"
#include "core/Logger.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "managers/ColonyRegistry.hpp"
#include <algorithm>

using Formicary::TileCoord;

size_t ForagingController::updateForaging(SimContext& ctx)
{
    const auto& food = ctx.config.food;
    auto& sources = ctx.agents.foodSources();

    m_commands.clear();
    m_sourceAt.clear();
    for (size_t i = 0; i < sources.size(); ++i) {
        if (sources[i].amount > 0) {
            m_sourceAt.emplace(sources[i].position, i);
        }
    }

    size_t pickups = 0;
    size_t deliveries = 0;

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || agent.role() != AgentRole::Worker) {
            continue;
        }

        switch (agent.state()) {
        case BehaviorState::Wandering:
        case BehaviorState::Following: {
            auto found = m_sourceAt.find(agent.position);
            if (found == m_sourceAt.end()) {
                break;
            }
            FoodSource& source = sources[found->second];
            // Earlier workers this tick may have emptied it
            uint32_t taken = std::min(source.amount, food.foodPerPickup);
            if (taken == 0) {
                break;
            }
            source.amount -= taken;
            m_commands.push(AgentCommand::BeginCarry{agent.handle, taken});
            ++pickups;
            break;
        }

        case BehaviorState::Carrying: {
            const ColonyState* colony = ctx.colonies.get(agent.colonyId);
            if (colony == nullptr ||
                Formicary::manhattanDistance(agent.position, colony->home) > food.depositDistance) {
                break;
            }
            ctx.colonies.addFood(agent.colonyId, food.foodPerDeposit);
            m_commands.push(AgentCommand::EndCarry{agent.handle});
            ++deliveries;
            break;
        }

        default:
            break;
        }
    }

    m_commands.apply(ctx.agents);

    if (pickups + deliveries > 0) {
        FORAGE_DEBUG("Tick " + std::to_string(ctx.tick) + ": " + std::to_string(pickups) +
                     " pickups, " + std::to_string(deliveries) + " deliveries");
    }
    return pickups + deliveries;
}

void ForagingController::regrowFood(SimContext& ctx)
{
    for (FoodSource& source : ctx.agents.foodSources()) {
        if (source.amount < source.spawnAmount) {
            source.amount = std::min(source.amount + source.regrowRate, source.spawnAmount);
        }
    }
}
