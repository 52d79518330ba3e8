/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COLONY_SIMULATION_HPP
#define COLONY_SIMULATION_HPP

#include "controllers/colony/AphidController.hpp"
#include "controllers/colony/CombatController.hpp"
#include "controllers/colony/DigController.hpp"
#include "controllers/colony/ForagingController.hpp"
#include "controllers/colony/LifecycleController.hpp"
#include "controllers/colony/MovementController.hpp"
#include "controllers/colony/PheromoneController.hpp"
#include "controllers/world/FloodController.hpp"
#include "controllers/world/HazardController.hpp"
#include "core/SimConfig.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "managers/ColonyRegistry.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace Formicary {
class IRandomSource;
class ITerrainSurface;
class PheromoneField;
class SpatialGrid;
class WaterGrid;
}

/**
 * Per-colony snapshot used for periodic reporting.
 */
struct ColonyCensus {
    uint8_t id{0};
    uint32_t foodStored{0};
    bool queenAlive{false};
    std::array<size_t, static_cast<size_t>(AgentRole::COUNT)> byRole{};

    [[nodiscard]] size_t count(AgentRole role) const { return byRole[static_cast<size_t>(role)]; }
};

/**
 * ColonySimulation owns the world state and runs one tick at a time.
 *
 * Every tick runs the same phase sequence to completion:
 *   1. tick counter, spatial index rebuild
 *   2. decisions (worker tasks, soldier fight, worker flee, surfacing)
 *   3. movement
 *   4. actions (dig, forage, combat on its interval, aphids)
 *   5. pheromone decay, diffusion, deposit
 *   6. lifecycle, food regrowth on its interval
 *   7. cave-ins, water pressure and flow, evaporation on their intervals;
 *      rain, drowning and flood response every tick
 *   8. removal of everything tombstoned this tick
 *
 * The configuration is validated once in init() and never re-read.
 */
class ColonySimulation {
public:
    ColonySimulation();
    ~ColonySimulation();

    ColonySimulation(const ColonySimulation&) = delete;
    ColonySimulation& operator=(const ColonySimulation&) = delete;

    /**
     * Builds fields and controllers around the given terrain.
     * @param config Tuning snapshot, rejected if validate() fails
     * @param terrain Tile grid the simulation takes ownership of
     * @param rng Random source the simulation takes ownership of
     * @return true on success; on failure nothing is ticked
     */
    bool init(const Formicary::SimConfig& config, std::unique_ptr<Formicary::ITerrainSurface> terrain,
              std::unique_ptr<Formicary::IRandomSource> rng);

    /**
     * Places colonies, food, aphids and water sources.
     * @return false if the world has no room for a single colony
     */
    bool populate();

    /**
     * Runs one full tick. Does nothing on an uninitialized simulation.
     */
    void tick();

    /**
     * Releases all state. init() may be called again afterwards.
     */
    void clean();

    bool isInitialized() const { return m_initialized; }
    uint64_t getTick() const { return m_tick; }

    /**
     * Agents removed by the last cleanup sweep.
     */
    size_t getRemovedLastTick() const { return m_removedLastTick; }

    const Formicary::SimConfig& getConfig() const { return m_config; }
    Formicary::ITerrainSurface& getTerrain() { return *mp_terrain; }
    const Formicary::ITerrainSurface& getTerrain() const { return *mp_terrain; }
    AgentDataManager& getAgents() { return m_agents; }
    const AgentDataManager& getAgents() const { return m_agents; }
    ColonyRegistry& getColonies() { return *mp_colonies; }
    const ColonyRegistry& getColonies() const { return *mp_colonies; }
    Formicary::PheromoneField& getPheromones() { return *mp_pheromones; }
    const Formicary::PheromoneField& getPheromones() const { return *mp_pheromones; }
    Formicary::WaterGrid& getWater() { return *mp_water; }
    const Formicary::WaterGrid& getWater() const { return *mp_water; }
    const Formicary::SpatialGrid& getSpatialGrid() const { return *mp_spatial; }

    /**
     * Live population and stores per colony.
     */
    std::vector<ColonyCensus> census() const;

    /**
     * Logs one info line per colony plus a world summary.
     */
    void logStats() const;

private:
    void rebuildSpatialIndex();
    void runDecisionPhase();
    void runMovementPhase();
    void runActionPhase();
    void runPheromonePhase();
    void runLifecyclePhase();
    void runEnvironmentPhase();
    void runCleanupPhase();

    Formicary::SimConfig m_config;
    bool m_initialized{false};
    uint64_t m_tick{0};
    size_t m_removedLastTick{0};

    std::unique_ptr<Formicary::ITerrainSurface> mp_terrain;
    std::unique_ptr<Formicary::IRandomSource> mp_rng;
    AgentDataManager m_agents;
    std::unique_ptr<ColonyRegistry> mp_colonies;
    std::unique_ptr<Formicary::SpatialGrid> mp_spatial;
    std::unique_ptr<Formicary::PheromoneField> mp_pheromones;
    std::unique_ptr<Formicary::WaterGrid> mp_water;
    std::unique_ptr<SimContext> mp_context;

    // Controllers, one of each, called in phase order
    MovementController m_movement;
    DigController m_dig;
    CombatController m_combat;
    ForagingController m_foraging;
    AphidController m_aphids;
    PheromoneController m_pheromoneDeposits;
    LifecycleController m_lifecycle;
    HazardController m_hazards;
    FloodController m_flood;
};

#endif // COLONY_SIMULATION_HPP
