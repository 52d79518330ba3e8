/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/FloodController.hpp"
#include "core/Logger.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "world/TerrainSurface.hpp"
#include "world/WaterGrid.hpp"

std::optional<uint32_t> FloodController::drownThreshold(uint8_t depth, const Formicary::WaterSettings& settings)
{
    if (depth >= 7) {
        return settings.drownThreshold7;
    }
    switch (depth) {
    case 6: return settings.drownThreshold6;
    case 5: return settings.drownThreshold5;
    case 4: return settings.drownThreshold4;
    default: return std::nullopt;
    }
}

size_t FloodController::processDrowning(SimContext& ctx)
{
    const auto& water = ctx.config.water;
    m_commands.clear();
    size_t drowned = 0;

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive()) {
            continue;
        }
        uint8_t depth = ctx.water.depth(agent.position.x, agent.position.y);

        if (depth < water.dangerousThreshold) {
            if (agent.submersion.has_value()) {
                m_commands.push(AgentCommand::ClearSubmersion{agent.handle});
            }
            continue;
        }

        uint32_t submerged = agent.submersion ? agent.submersion->ticks + 1 : 1;
        auto limit = drownThreshold(depth, water);
        if (limit && submerged >= *limit) {
            m_commands.push(AgentCommand::Tombstone{agent.handle});
            ++drowned;
        } else {
            m_commands.push(AgentCommand::SetSubmersion{agent.handle, submerged});
        }
    }

    m_commands.apply(ctx.agents);

    if (drowned > 0) {
        FLOOD_INFO("Tick " + std::to_string(ctx.tick) + ": " + std::to_string(drowned) + " agents drowned");
    }
    return drowned;
}

size_t FloodController::fleeFlood(SimContext& ctx)
{
    m_commands.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || !agent.behavior.allows(BehaviorState::Returning)) {
            continue;
        }
        BehaviorState state = agent.state();
        // Carriers already climb towards the surface home and keep their load
        if (state == BehaviorState::Fleeing || state == BehaviorState::Returning ||
            state == BehaviorState::Carrying) {
            continue;
        }
        if (ctx.water.depth(agent.position.x, agent.position.y) >= ctx.config.water.fleeFloodDepth) {
            m_commands.push(AgentCommand::Transition{agent.handle, BehaviorState::Returning});
        }
    }

    size_t fled = m_commands.apply(ctx.agents);
    if (fled > 0) {
        FLOOD_DEBUG("Tick " + std::to_string(ctx.tick) + ": " + std::to_string(fled) + " agents escaping water");
    }
    return fled;
}

size_t FloodController::updateSurfacing(SimContext& ctx)
{
    m_commands.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || !agent.behavior.is(BehaviorState::Returning)) {
            continue;
        }
        if (ctx.terrain.get(agent.position.x, agent.position.y) != Formicary::TileKind::Surface) {
            continue;
        }
        if (agent.role() == AgentRole::Soldier) {
            m_commands.push(AgentCommand::Transition{agent.handle, BehaviorState::Wandering});
        } else if (agent.role() == AgentRole::Queen) {
            m_commands.push(AgentCommand::Transition{agent.handle, BehaviorState::Idle});
        }
    }

    return m_commands.apply(ctx.agents);
}
