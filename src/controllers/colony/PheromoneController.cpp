/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/colony/PheromoneController.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "managers/ColonyRegistry.hpp"
#include "world/PheromoneField.hpp"
#include <algorithm>

using Formicary::PheromoneType;
using Formicary::TileCoord;

float PheromoneController::proximity(TileCoord pos, TileCoord home, int32_t radius)
{
    if (radius <= 0) {
        return 0.0f;
    }
    float distance = static_cast<float>(Formicary::manhattanDistance(pos, home));
    return std::max(0.0f, 1.0f - distance / static_cast<float>(radius));
}

void PheromoneController::update(SimContext& ctx)
{
    ctx.pheromones.decay();
    ctx.pheromones.diffuse();
    depositFromAgents(ctx);
}

void PheromoneController::depositFromAgents(SimContext& ctx)
{
    const auto& settings = ctx.config.pheromone;

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive()) {
            continue;
        }
        const TileCoord pos = agent.position;

        switch (agent.state()) {
        case BehaviorState::Carrying:
            ctx.pheromones.depositAdaptive(pos.x, pos.y, agent.colonyId, PheromoneType::Food,
                                           settings.depositFood);
            break;

        case BehaviorState::Wandering:
        case BehaviorState::Returning:
        case BehaviorState::Digging: {
            const ColonyState* colony = ctx.colonies.get(agent.colonyId);
            if (colony == nullptr) {
                break;
            }
            bool digging = agent.behavior.is(BehaviorState::Digging);
            float weight = digging
                ? settings.digDepositMultiplier * proximity(pos, colony->home, settings.digDepositRadius)
                : proximity(pos, colony->home, settings.homeDepositRadius);
            if (weight > 0.0f) {
                ctx.pheromones.depositAdaptive(pos.x, pos.y, agent.colonyId, PheromoneType::Home,
                                               settings.depositHome * weight);
            }
            break;
        }

        default:
            break;
        }
    }
}
