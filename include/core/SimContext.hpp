/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIM_CONTEXT_HPP
#define SIM_CONTEXT_HPP

#include "core/SimConfig.hpp"
#include <cstdint>

namespace Formicary {
class IRandomSource;
class ITerrainSurface;
class PheromoneField;
class SpatialGrid;
class WaterGrid;
}
class AgentDataManager;
class ColonyRegistry;

/**
 * @brief Everything a controller may read or write during one tick
 *
 * Built by ColonySimulation (or a test fixture) over state it owns. The
 * context never owns anything.
 */
struct SimContext {
    const Formicary::SimConfig& config;
    Formicary::ITerrainSurface& terrain;
    AgentDataManager& agents;
    ColonyRegistry& colonies;
    Formicary::SpatialGrid& spatial;
    Formicary::PheromoneField& pheromones;
    Formicary::WaterGrid& water;
    Formicary::IRandomSource& rng;

    // Current tick, incremented before any phase runs
    uint64_t tick{0};

    /// True on ticks that are a multiple of interval (interval 0 never fires)
    [[nodiscard]] bool onCadence(uint32_t interval) const noexcept {
        return interval != 0 && tick % interval == 0;
    }
};

#endif // SIM_CONTEXT_HPP
