/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/colony/LifecycleController.hpp"
#include "core/Logger.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "managers/ColonyRegistry.hpp"
#include "utils/RandomSource.hpp"
#include "world/TerrainSurface.hpp"
#include <array>

using Formicary::TileCoord;
using Formicary::TileOffset;

namespace {

constexpr std::array<TileOffset, 6> EGG_OFFSETS{{
    {0, 1}, {1, 0}, {-1, 0}, {0, -1}, {1, 1}, {-1, 1}
}};

uint32_t adultLifespan(AgentRole role, const Formicary::LifecycleSettings& lifecycle)
{
    switch (role) {
    case AgentRole::Soldier: return lifecycle.soldierLifespan;
    case AgentRole::Queen:   return lifecycle.queenLifespan;
    default:                 return lifecycle.workerLifespan;
    }
}

} // anonymous namespace

void LifecycleController::update(SimContext& ctx)
{
    ageAgents(ctx);

    if (ctx.onCadence(ctx.config.lifecycle.queenLayInterval)) {
        layEggs(ctx);
    }
    if (ctx.onCadence(ctx.config.lifecycle.foodConsumeInterval)) {
        consumeFood(ctx);
    }
}

void LifecycleController::ageAgents(SimContext& ctx)
{
    const auto& lifecycle = ctx.config.lifecycle;
    m_commands.clear();

    size_t hatched = 0;
    size_t matured = 0;
    size_t died = 0;

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || !agent.age.has_value()) {
            continue;
        }

        AgeCounter aged = *agent.age;
        ++aged.ticks;

        switch (agent.role()) {
        case AgentRole::Egg:
            if (aged.ticks >= aged.maxTicks) {
                m_commands.push(AgentCommand::Hatch{agent.handle, AgeCounter{0, lifecycle.larvaeMatureTime}});
                ++hatched;
                continue;
            }
            break;

        case AgentRole::Larvae:
            if (aged.ticks >= aged.maxTicks) {
                AgentRole adult = ctx.rng.nextByte() < lifecycle.workerRatioThreshold
                    ? AgentRole::Worker : AgentRole::Soldier;
                m_commands.push(AgentCommand::Mature{agent.handle, adult,
                                                     AgeCounter{0, adultLifespan(adult, lifecycle)}});
                ++matured;
                continue;
            }
            break;

        default:
            if (aged.ticks > aged.maxTicks) {
                m_commands.push(AgentCommand::Tombstone{agent.handle});
                ++died;
                continue;
            }
            break;
        }

        m_commands.push(AgentCommand::SetAge{agent.handle, aged});
    }

    m_commands.apply(ctx.agents);

    if (hatched + matured + died > 0) {
        LIFECYCLE_DEBUG("Tick " + std::to_string(ctx.tick) + ": " + std::to_string(hatched) +
                        " hatched, " + std::to_string(matured) + " matured, " +
                        std::to_string(died) + " died of age");
    }
}

size_t LifecycleController::layEggs(SimContext& ctx)
{
    const auto& lifecycle = ctx.config.lifecycle;
    m_commands.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || agent.role() != AgentRole::Queen) {
            continue;
        }
        ColonyState* colony = ctx.colonies.get(agent.colonyId);
        if (colony == nullptr || !colony->queenAlive || colony->foodStored < lifecycle.foodPerEgg) {
            continue;
        }
        ctx.colonies.consumeFood(agent.colonyId, lifecycle.foodPerEgg);

        TileCoord spot = agent.position + EGG_OFFSETS[ctx.rng.pickIndex(EGG_OFFSETS.size())];
        if (!ctx.terrain.isPassable(spot.x, spot.y)) {
            spot = agent.position;
        }
        m_commands.push(AgentCommand::Spawn{spot, agent.colonyId, AgentRole::Egg,
                                            AgeCounter{0, lifecycle.eggHatchTime}});
    }

    size_t laid = m_commands.apply(ctx.agents);
    if (laid > 0) {
        LIFECYCLE_DEBUG("Tick " + std::to_string(ctx.tick) + ": " + std::to_string(laid) + " eggs laid");
    }
    return laid;
}

void LifecycleController::consumeFood(SimContext& ctx)
{
    const auto& lifecycle = ctx.config.lifecycle;
    m_upkeep.assign(ctx.colonies.size(), 0);

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || agent.colonyId >= m_upkeep.size()) {
            continue;
        }
        switch (agent.role()) {
        case AgentRole::Larvae:
            m_upkeep[agent.colonyId] += lifecycle.larvaeFoodCost;
            break;
        case AgentRole::Queen:
        case AgentRole::Worker:
        case AgentRole::Soldier:
            m_upkeep[agent.colonyId] += lifecycle.antFoodCost;
            break;
        default:
            break;
        }
    }

    for (size_t id = 0; id < m_upkeep.size(); ++id) {
        if (m_upkeep[id] > 0) {
            ctx.colonies.consumeFood(static_cast<uint8_t>(id), m_upkeep[id]);
        }
    }
}
