/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/colony/DigController.hpp"
#include "core/Logger.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "utils/RandomSource.hpp"
#include "world/PheromoneField.hpp"
#include "world/TerrainSurface.hpp"
#include <array>

using Formicary::TileCoord;
using Formicary::TileKind;
using Formicary::TileOffset;

namespace {

// Excavation priority, downward first
constexpr std::array<TileOffset, 5> DIG_TARGETS{{
    {0, 1}, {-1, 1}, {1, 1}, {-1, 0}, {1, 0}
}};

// Walls hardened around a fresh tunnel tile
constexpr std::array<TileOffset, 5> REINFORCE_TARGETS{{
    {-1, 0}, {1, 0}, {0, -1}, {-1, -1}, {1, -1}
}};

} // anonymous namespace

bool DigController::canDig(const Formicary::ITerrainSurface& terrain, TileCoord pos)
{
    for (const TileOffset& dir : DIG_TARGETS) {
        if (terrain.isDiggable(pos.x + dir.x, pos.y + dir.y)) {
            return true;
        }
    }
    return false;
}

bool DigController::onGround(const Formicary::ITerrainSurface& terrain, TileCoord pos)
{
    return !terrain.isPassable(pos.x, pos.y + 1) || terrain.get(pos.x, pos.y) == TileKind::Surface;
}

size_t DigController::updateWorkerStates(SimContext& ctx)
{
    m_commands.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || agent.role() != AgentRole::Worker) {
            continue;
        }
        BehaviorState next = decideWorkerState(ctx, agent);
        if (next != agent.state()) {
            m_commands.push(AgentCommand::Transition{agent.handle, next});
        }
    }

    return m_commands.apply(ctx.agents);
}

BehaviorState DigController::decideWorkerState(SimContext& ctx, const Agent& worker) const
{
    const auto& movement = ctx.config.movement;
    const TileCoord pos = worker.position;
    const TileKind here = ctx.terrain.get(pos.x, pos.y);

    switch (worker.state()) {
    case BehaviorState::Wandering: {
        if (canDig(ctx.terrain, pos) && onGround(ctx.terrain, pos) &&
            ctx.rng.nextByte() < movement.startDigChance) {
            return BehaviorState::Digging;
        }
        float trail = ctx.pheromones.get(pos.x, pos.y, worker.colonyId, Formicary::PheromoneType::Food);
        if (trail > ctx.config.food.foodPheromoneThreshold) {
            return BehaviorState::Following;
        }
        return BehaviorState::Wandering;
    }

    case BehaviorState::Following: {
        float trail = ctx.pheromones.get(pos.x, pos.y, worker.colonyId, Formicary::PheromoneType::Food);
        if (trail < ctx.config.food.foodPheromoneThreshold) {
            return BehaviorState::Wandering;
        }
        return BehaviorState::Following;
    }

    case BehaviorState::Digging: {
        if (!canDig(ctx.terrain, pos)) {
            return BehaviorState::Returning;
        }
        // Deeper workers give up sooner
        uint8_t returnChance = here == TileKind::Tunnel ? movement.undergroundReturnChance
                                                        : movement.surfaceReturnChance;
        if (ctx.rng.nextByte() < returnChance) {
            return BehaviorState::Returning;
        }
        return BehaviorState::Digging;
    }

    case BehaviorState::Returning:
        if (here == TileKind::Surface) {
            return BehaviorState::Wandering;
        }
        if (canDig(ctx.terrain, pos) && onGround(ctx.terrain, pos) &&
            ctx.rng.nextByte() < movement.digDistractionChance) {
            return BehaviorState::Digging;
        }
        return BehaviorState::Returning;

    case BehaviorState::Idle:
        if (ctx.rng.nextByte() < movement.idleToWanderChance) {
            return BehaviorState::Wandering;
        }
        return BehaviorState::Idle;

    default:
        return worker.state();
    }
}

size_t DigController::applyDigging(SimContext& ctx)
{
    m_digTargets.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || agent.role() != AgentRole::Worker ||
            !agent.behavior.is(BehaviorState::Digging)) {
            continue;
        }
        if (ctx.rng.nextByte() >= ctx.config.movement.digChance) {
            continue;
        }
        for (const TileOffset& dir : DIG_TARGETS) {
            TileCoord target = agent.position + dir;
            if (ctx.terrain.isDiggable(target.x, target.y)) {
                m_digTargets.push_back(target);
                break;
            }
        }
    }

    size_t dug = 0;
    for (const TileCoord& target : m_digTargets) {
        // Two workers may have picked the same tile
        if (!ctx.terrain.isDiggable(target.x, target.y)) {
            continue;
        }
        ctx.terrain.set(target.x, target.y, TileKind::Tunnel);
        ++dug;

        for (const TileOffset& dir : REINFORCE_TARGETS) {
            TileCoord wall = target + dir;
            if (ctx.terrain.isDiggable(wall.x, wall.y) &&
                ctx.rng.nextByte() < ctx.config.movement.reinforceChance) {
                ctx.terrain.set(wall.x, wall.y, TileKind::DenseSoil);
            }
        }
    }

    if (dug > 0) {
        DIG_DEBUG("Tick " + std::to_string(ctx.tick) + ": dug " + std::to_string(dug) + " tiles");
    }
    return dug;
}
