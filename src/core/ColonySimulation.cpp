/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ColonySimulation.hpp"
#include "core/Logger.hpp"
#include "spatial/SpatialGrid.hpp"
#include "utils/RandomSource.hpp"
#include "world/PheromoneField.hpp"
#include "world/TerrainSurface.hpp"
#include "world/WaterGrid.hpp"
#include "world/WorldPopulator.hpp"

ColonySimulation::ColonySimulation() = default;

ColonySimulation::~ColonySimulation() = default;

bool ColonySimulation::init(const Formicary::SimConfig& config,
                            std::unique_ptr<Formicary::ITerrainSurface> terrain,
                            std::unique_ptr<Formicary::IRandomSource> rng) {
    if (m_initialized) {
        SIM_WARN("Already initialized, call clean() first");
        return false;
    }
    if (!terrain || !rng) {
        SIM_CRITICAL("Terrain and random source are required");
        return false;
    }

    std::string error;
    if (!config.validate(error)) {
        SIM_CRITICAL("Invalid configuration: " + error);
        return false;
    }
    if (terrain->width() != config.world.width || terrain->height() != config.world.height) {
        SIM_CRITICAL("Terrain is " + std::to_string(terrain->width()) + "x" +
                     std::to_string(terrain->height()) + " but world is configured as " +
                     std::to_string(config.world.width) + "x" + std::to_string(config.world.height));
        return false;
    }

    m_config = config;
    mp_terrain = std::move(terrain);
    mp_rng = std::move(rng);

    const int32_t width = m_config.world.width;
    const int32_t height = m_config.world.height;
    mp_colonies = std::make_unique<ColonyRegistry>(m_config.colony.capacity);
    mp_spatial = std::make_unique<Formicary::SpatialGrid>(width, height, m_config.world.spatialCellSize);
    mp_pheromones = std::make_unique<Formicary::PheromoneField>(width, height, m_config.colony.capacity,
                                                                m_config.pheromone);
    mp_water = std::make_unique<Formicary::WaterGrid>(width, height, m_config.water);

    mp_context = std::make_unique<SimContext>(SimContext{
        m_config, *mp_terrain, m_agents, *mp_colonies, *mp_spatial, *mp_pheromones, *mp_water, *mp_rng, 0});

    m_agents.clear();
    m_tick = 0;
    m_removedLastTick = 0;
    m_initialized = true;

    SIM_INFO("Simulation initialized: " + std::to_string(width) + "x" + std::to_string(height) +
             ", colony capacity " + std::to_string(m_config.colony.capacity));
    return true;
}

bool ColonySimulation::populate() {
    if (!m_initialized) {
        SIM_ERROR("populate() called before init()");
        return false;
    }
    Formicary::WorldPopulator populator(m_config, *mp_rng);
    return populator.populate(*mp_terrain, m_agents, *mp_colonies, *mp_water);
}

void ColonySimulation::tick() {
    if (!m_initialized) {
        SIM_WARN("tick() called on an uninitialized simulation");
        return;
    }

    ++m_tick;
    mp_context->tick = m_tick;

    rebuildSpatialIndex();
    runDecisionPhase();
    runMovementPhase();
    runActionPhase();
    runPheromonePhase();
    runLifecyclePhase();
    runEnvironmentPhase();
    runCleanupPhase();
}

void ColonySimulation::rebuildSpatialIndex() {
    mp_spatial->clear();
    for (const Agent& agent : m_agents.agents()) {
        if (agent.isAlive()) {
            mp_spatial->insert(agent.handle, agent.position, agent.colonyId);
        }
    }
}

void ColonySimulation::runDecisionPhase() {
    SimContext& ctx = *mp_context;
    m_dig.updateWorkerStates(ctx);
    m_combat.updateSoldierStates(ctx);
    m_combat.updateFleeStates(ctx);
    m_flood.updateSurfacing(ctx);
}

void ColonySimulation::runMovementPhase() {
    m_movement.moveAgents(*mp_context);
}

void ColonySimulation::runActionPhase() {
    SimContext& ctx = *mp_context;
    m_dig.applyDigging(ctx);
    m_foraging.updateForaging(ctx);
    if (ctx.onCadence(m_config.combat.combatInterval)) {
        m_combat.resolveCombat(ctx);
    }
    m_aphids.updateAphids(ctx);
}

void ColonySimulation::runPheromonePhase() {
    m_pheromoneDeposits.update(*mp_context);
}

void ColonySimulation::runLifecyclePhase() {
    SimContext& ctx = *mp_context;
    m_lifecycle.update(ctx);
    if (ctx.onCadence(m_config.food.regrowInterval)) {
        m_foraging.regrowFood(ctx);
    }
}

void ColonySimulation::runEnvironmentPhase() {
    SimContext& ctx = *mp_context;

    if (ctx.onCadence(m_config.hazard.caveInInterval)) {
        m_hazards.processCollapses(ctx);
    }
    if (ctx.onCadence(m_config.water.flowInterval)) {
        mp_water->calculatePressure(*mp_terrain);
        mp_water->flow(*mp_terrain);
    }
    if (ctx.onCadence(m_config.water.evaporationInterval)) {
        mp_water->evaporate(*mp_terrain);
    }
    mp_water->updateRain(*mp_terrain, *mp_rng);

    m_flood.processDrowning(ctx);
    m_flood.fleeFlood(ctx);
}

void ColonySimulation::runCleanupPhase() {
    m_removedLastTick = m_agents.processDestructionQueue([this](const Agent& agent) {
        if (agent.role() == AgentRole::Queen) {
            mp_colonies->markQueenDead(agent.colonyId);
        }
    });
}

void ColonySimulation::clean() {
    if (!m_initialized) {
        return;
    }
    mp_context.reset();
    mp_water.reset();
    mp_pheromones.reset();
    mp_spatial.reset();
    mp_colonies.reset();
    m_agents.clear();
    mp_rng.reset();
    mp_terrain.reset();
    m_tick = 0;
    m_removedLastTick = 0;
    m_initialized = false;
    SIM_INFO("Simulation cleaned up");
}

std::vector<ColonyCensus> ColonySimulation::census() const {
    std::vector<ColonyCensus> result;
    if (!m_initialized) {
        return result;
    }

    for (const ColonyState& colony : mp_colonies->colonies()) {
        ColonyCensus entry;
        entry.id = colony.id;
        entry.foodStored = colony.foodStored;
        entry.queenAlive = colony.queenAlive;
        result.push_back(entry);
    }
    for (const Agent& agent : m_agents.agents()) {
        if (agent.isAlive() && agent.colonyId < result.size()) {
            ++result[agent.colonyId].byRole[static_cast<size_t>(agent.role())];
        }
    }
    return result;
}

void ColonySimulation::logStats() const {
    if (!m_initialized) {
        return;
    }

    for (const ColonyCensus& c : census()) {
        SIM_INFO("Tick " + std::to_string(m_tick) + " colony " + std::to_string(c.id) +
                 ": food " + std::to_string(c.foodStored) +
                 (c.queenAlive ? ", queen alive" : ", no queen") +
                 ", workers " + std::to_string(c.count(AgentRole::Worker)) +
                 ", soldiers " + std::to_string(c.count(AgentRole::Soldier)) +
                 ", eggs " + std::to_string(c.count(AgentRole::Egg)) +
                 ", larvae " + std::to_string(c.count(AgentRole::Larvae)));
    }

    const auto& rain = mp_water->activeRain();
    SIM_INFO("Tick " + std::to_string(m_tick) + " world: " + std::to_string(m_agents.getAgentCount()) +
             " agents, water " + std::to_string(mp_water->totalDepth()) +
             (rain ? ", raining" : ", dry"));
}
