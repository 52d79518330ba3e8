/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/colony/MovementController.hpp"
#include "core/Logger.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "managers/ColonyRegistry.hpp"
#include "utils/RandomSource.hpp"
#include "world/PheromoneField.hpp"
#include "world/TerrainSurface.hpp"
#include "world/WaterGrid.hpp"
#include <algorithm>
#include <array>
#include <limits>

using Formicary::PheromoneType;
using Formicary::TileCoord;
using Formicary::TileKind;
using Formicary::TileOffset;

namespace {

// Down is listed twice, and one slot stays put
constexpr std::array<TileOffset, 8> WANDER_STEPS{{
    {0, -1}, {0, 1}, {0, 1}, {-1, 0}, {1, 0}, {-1, 1}, {1, 1}, {0, 0}
}};

constexpr std::array<TileOffset, 5> DIG_STEPS{{
    {0, 1}, {-1, 1}, {1, 1}, {-1, 0}, {1, 0}
}};

constexpr std::array<TileOffset, 5> CLIMB_STEPS{{
    {0, -1}, {-1, -1}, {1, -1}, {-1, 0}, {1, 0}
}};

constexpr std::array<TileOffset, 2> LATERAL_STEPS{{
    {-1, 0}, {1, 0}
}};

float summedDanger(const Formicary::PheromoneField& field, TileCoord at, uint8_t colonies)
{
    float sum = 0.0f;
    for (uint8_t c = 0; c < colonies; ++c) {
        sum += field.get(at.x, at.y, c, PheromoneType::Danger);
    }
    return sum;
}

} // anonymous namespace

bool MovementController::canEnter(const SimContext& ctx, TileCoord tile)
{
    return ctx.terrain.isPassable(tile.x, tile.y) && ctx.water.isWadeable(tile.x, tile.y);
}

size_t MovementController::moveAgents(SimContext& ctx)
{
    m_commands.clear();

    for (const Agent& agent : ctx.agents.agents()) {
        if (!agent.isAlive() || AgentTraits::isBrood(agent.role())) {
            continue;
        }

        // Queens mostly sit still
        if (agent.role() == AgentRole::Queen &&
            ctx.rng.nextByte() > ctx.config.movement.queenMoveThreshold) {
            continue;
        }

        auto step = chooseStep(ctx, agent);
        if (!step || step->isZero()) {
            continue;
        }

        TileCoord destination = agent.position + *step;
        if (canEnter(ctx, destination)) {
            m_commands.push(AgentCommand::Move{agent.handle, destination});
        }
    }

    size_t moved = m_commands.apply(ctx.agents);
    MOVEMENT_DEBUG("Tick " + std::to_string(ctx.tick) + ": " + std::to_string(moved) + " agents moved");
    return moved;
}

std::optional<TileOffset> MovementController::chooseStep(SimContext& ctx, const Agent& agent) const
{
    const uint8_t colony = agent.colonyId;
    const TileCoord pos = agent.position;

    switch (agent.state()) {
    case BehaviorState::Wandering:
        return randomStep(ctx);

    case BehaviorState::Idle:
        if (ctx.rng.nextByte() < ctx.config.movement.idleMoveThreshold) {
            return randomStep(ctx);
        }
        return std::nullopt;

    case BehaviorState::Digging:
        return digStep(ctx, pos);

    case BehaviorState::Returning:
        return climbStep(ctx, pos);

    case BehaviorState::Carrying:
        return homeStep(ctx, agent);

    case BehaviorState::Following:
        if (auto dir = ctx.pheromones.followTrail(pos.x, pos.y, colony, PheromoneType::Food,
                                                  ctx.rng, ctx.terrain)) {
            return dir;
        }
        return randomStep(ctx);

    case BehaviorState::Fighting:
        if (auto dir = ctx.pheromones.strongestNeighbour(pos.x, pos.y, colony, PheromoneType::Danger)) {
            return dir;
        }
        return randomStep(ctx);

    case BehaviorState::Fleeing:
        return fleeStep(ctx, agent);
    }
    return std::nullopt;
}

TileOffset MovementController::randomStep(SimContext& ctx) const
{
    return WANDER_STEPS[ctx.rng.pickIndex(WANDER_STEPS.size())];
}

TileOffset MovementController::digStep(const SimContext& ctx, TileCoord pos) const
{
    // Step into whatever the dig action just opened
    for (const TileOffset& dir : DIG_STEPS) {
        TileKind kind = ctx.terrain.get(pos.x + dir.x, pos.y + dir.y);
        if (Formicary::isHollowKind(kind)) {
            return dir;
        }
    }
    return {0, 0};
}

TileOffset MovementController::climbStep(SimContext& ctx, TileCoord pos) const
{
    for (const TileOffset& dir : CLIMB_STEPS) {
        if (ctx.terrain.isPassable(pos.x + dir.x, pos.y + dir.y)) {
            return dir;
        }
    }
    for (const TileOffset& dir : LATERAL_STEPS) {
        if (ctx.terrain.isPassable(pos.x + dir.x, pos.y + dir.y) && ctx.rng.coinFlip()) {
            return dir;
        }
    }
    return {0, 0};
}

TileOffset MovementController::homeStep(SimContext& ctx, const Agent& agent) const
{
    const ColonyState* colony = ctx.colonies.get(agent.colonyId);
    if (!colony) {
        return randomStep(ctx);
    }

    const TileCoord pos = agent.position;
    const int32_t dx = Formicary::signum(colony->home.x - pos.x);
    const int32_t dy = Formicary::signum(colony->home.y - pos.y);

    if (dx != 0 || dy != 0) {
        if (canEnter(ctx, {pos.x + dx, pos.y + dy})) {
            return {dx, dy};
        }
        if (dx != 0 && canEnter(ctx, {pos.x + dx, pos.y})) {
            return {dx, 0};
        }
        if (dy != 0 && canEnter(ctx, {pos.x, pos.y + dy})) {
            return {0, dy};
        }
    }

    if (auto dir = ctx.pheromones.followTrail(pos.x, pos.y, agent.colonyId, PheromoneType::Home,
                                              ctx.rng, ctx.terrain)) {
        return *dir;
    }
    return randomStep(ctx);
}

TileOffset MovementController::fleeStep(SimContext& ctx, const Agent& agent) const
{
    const uint8_t scanned = std::min(ctx.config.combat.maxColoniesScan, ctx.pheromones.colonyCapacity());
    const float here = summedDanger(ctx.pheromones, agent.position, scanned);

    std::optional<TileOffset> best;
    float lowest = std::numeric_limits<float>::max();
    for (const TileOffset& dir : Formicary::PHEROMONE_DIRECTIONS) {
        float danger = summedDanger(ctx.pheromones, agent.position + dir, scanned);
        if (danger < lowest && danger < here) {
            lowest = danger;
            best = dir;
        }
    }

    if (best) {
        return *best;
    }
    return randomStep(ctx);
}
