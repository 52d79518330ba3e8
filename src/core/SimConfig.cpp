/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <limits>

namespace Formicary {

namespace {

class SettingsReader {
public:
    explicit SettingsReader(const SettingsManager& settings) : m_settings(settings) {}

    void read(const char* category, const char* key, float& field) const {
        field = m_settings.get<float>(category, key, field);
    }

    void read(const char* category, const char* key, int32_t& field) const {
        field = m_settings.get<int>(category, key, field);
    }

    void read(const char* category, const char* key, uint32_t& field) const {
        int raw = m_settings.get<int>(category, key, static_cast<int>(std::min<uint32_t>(
            field, static_cast<uint32_t>(std::numeric_limits<int>::max()))));
        if (raw < 0) {
            SETTINGS_WARNING(std::string(category) + "." + key + " is negative, clamped to 0");
            raw = 0;
        }
        field = static_cast<uint32_t>(raw);
    }

    void read(const char* category, const char* key, uint8_t& field) const {
        int raw = m_settings.get<int>(category, key, field);
        if (raw < 0 || raw > 255) {
            SETTINGS_WARNING(std::string(category) + "." + key + " outside 0..255, clamped");
            raw = std::clamp(raw, 0, 255);
        }
        field = static_cast<uint8_t>(raw);
    }

private:
    const SettingsManager& m_settings;
};

bool fail(std::string& error, const std::string& message) {
    error = message;
    return false;
}

} // anonymous namespace

SimConfig SimConfig::fromSettings(const SettingsManager& settings) {
    SimConfig config;
    SettingsReader r(settings);

    r.read("world", "width", config.world.width);
    r.read("world", "height", config.world.height);
    r.read("world", "surface_row", config.world.surfaceRow);
    r.read("world", "dense_row", config.world.denseRow);
    r.read("world", "bedrock_row", config.world.bedrockRow);
    r.read("world", "spatial_cell_size", config.world.spatialCellSize);

    r.read("colony", "capacity", config.colony.capacity);
    r.read("colony", "initial_food", config.colony.initialFood);

    auto& ph = config.pheromone;
    r.read("pheromone", "max_strength", ph.maxStrength);
    r.read("pheromone", "decay_food", ph.decayFood);
    r.read("pheromone", "decay_home", ph.decayHome);
    r.read("pheromone", "decay_danger", ph.decayDanger);
    r.read("pheromone", "snap_threshold", ph.snapThreshold);
    r.read("pheromone", "deposit_food", ph.depositFood);
    r.read("pheromone", "deposit_home", ph.depositHome);
    r.read("pheromone", "deposit_danger", ph.depositDanger);
    r.read("pheromone", "diffusion_rate", ph.diffusionRate);
    r.read("pheromone", "home_deposit_radius", ph.homeDepositRadius);
    r.read("pheromone", "dig_deposit_radius", ph.digDepositRadius);
    r.read("pheromone", "dig_deposit_multiplier", ph.digDepositMultiplier);
    r.read("pheromone", "gradient_threshold", ph.gradientThreshold);

    auto& cb = config.combat;
    r.read("combat", "base_damage", cb.baseDamage);
    r.read("combat", "combat_interval", cb.combatInterval);
    r.read("combat", "soldier_strength", cb.soldierStrength);
    r.read("combat", "worker_strength", cb.workerStrength);
    r.read("combat", "other_strength", cb.otherStrength);
    r.read("combat", "danger_deposit", cb.dangerDeposit);
    r.read("combat", "damage_random_range", cb.damageRandomRange);
    r.read("combat", "damage_offset", cb.damageOffset);
    r.read("combat", "default_health", cb.defaultHealth);
    r.read("combat", "default_fighter_strength", cb.defaultFighterStrength);
    r.read("combat", "soldier_fight_danger_threshold", cb.soldierFightDangerThreshold);
    r.read("combat", "soldier_stop_fight_threshold", cb.soldierStopFightThreshold);
    r.read("combat", "worker_flee_danger_threshold", cb.workerFleeDangerThreshold);
    r.read("combat", "worker_stop_flee_threshold", cb.workerStopFleeThreshold);
    r.read("combat", "max_colonies_scan", cb.maxColoniesScan);

    auto& lc = config.lifecycle;
    r.read("lifecycle", "egg_hatch_time", lc.eggHatchTime);
    r.read("lifecycle", "larvae_mature_time", lc.larvaeMatureTime);
    r.read("lifecycle", "queen_lay_interval", lc.queenLayInterval);
    r.read("lifecycle", "food_per_egg", lc.foodPerEgg);
    r.read("lifecycle", "worker_lifespan", lc.workerLifespan);
    r.read("lifecycle", "soldier_lifespan", lc.soldierLifespan);
    r.read("lifecycle", "queen_lifespan", lc.queenLifespan);
    r.read("lifecycle", "food_consume_interval", lc.foodConsumeInterval);
    r.read("lifecycle", "larvae_food_cost", lc.larvaeFoodCost);
    r.read("lifecycle", "ant_food_cost", lc.antFoodCost);
    r.read("lifecycle", "worker_ratio_threshold", lc.workerRatioThreshold);

    auto& mv = config.movement;
    r.read("movement", "queen_move_threshold", mv.queenMoveThreshold);
    r.read("movement", "idle_move_threshold", mv.idleMoveThreshold);
    r.read("movement", "dig_chance", mv.digChance);
    r.read("movement", "reinforce_chance", mv.reinforceChance);
    r.read("movement", "start_dig_chance", mv.startDigChance);
    r.read("movement", "underground_return_chance", mv.undergroundReturnChance);
    r.read("movement", "surface_return_chance", mv.surfaceReturnChance);
    r.read("movement", "dig_distraction_chance", mv.digDistractionChance);
    r.read("movement", "idle_to_wander_chance", mv.idleToWanderChance);

    auto& fd = config.food;
    r.read("food", "num_sources", fd.numSources);
    r.read("food", "initial_amount", fd.initialAmount);
    r.read("food", "regrow_interval", fd.regrowInterval);
    r.read("food", "regrow_rate", fd.regrowRate);
    r.read("food", "deposit_distance", fd.depositDistance);
    r.read("food", "food_per_deposit", fd.foodPerDeposit);
    r.read("food", "food_per_pickup", fd.foodPerPickup);
    r.read("food", "food_pheromone_threshold", fd.foodPheromoneThreshold);

    auto& sp = config.spawn;
    r.read("spawn", "num_colonies", sp.numColonies);
    r.read("spawn", "num_aphids", sp.numAphids);
    r.read("spawn", "initial_workers", sp.initialWorkers);
    r.read("spawn", "min_colony_distance", sp.minColonyDistance);
    r.read("spawn", "aphid_food_rate", sp.aphidFoodRate);
    r.read("spawn", "aphid_nearby_distance", sp.aphidNearbyDistance);

    auto& wt = config.water;
    r.read("water", "max_depth", wt.maxDepth);
    r.read("water", "num_sources", wt.numSources);
    r.read("water", "passable_threshold", wt.passableThreshold);
    r.read("water", "dangerous_threshold", wt.dangerousThreshold);
    r.read("water", "evaporation_max_depth", wt.evaporationMaxDepth);
    r.read("water", "stagnant_evaporation_ticks", wt.stagnantEvaporationTicks);
    r.read("water", "rain_chance", wt.rainChance);
    r.read("water", "rain_intensity_min", wt.rainIntensityMin);
    r.read("water", "rain_intensity_max", wt.rainIntensityMax);
    r.read("water", "rain_duration_min", wt.rainDurationMin);
    r.read("water", "rain_duration_max", wt.rainDurationMax);
    r.read("water", "rain_coverage_min", wt.rainCoverageMin);
    r.read("water", "rain_coverage_max", wt.rainCoverageMax);
    r.read("water", "drown_threshold_7", wt.drownThreshold7);
    r.read("water", "drown_threshold_6", wt.drownThreshold6);
    r.read("water", "drown_threshold_5", wt.drownThreshold5);
    r.read("water", "drown_threshold_4", wt.drownThreshold4);
    r.read("water", "flee_flood_depth", wt.fleeFloodDepth);
    r.read("water", "flow_interval", wt.flowInterval);
    r.read("water", "evaporation_interval", wt.evaporationInterval);
    r.read("water", "upward_pressure_margin", wt.upwardPressureMargin);

    auto& hz = config.hazard;
    r.read("hazard", "cave_in_interval", hz.caveInInterval);
    r.read("hazard", "dense_stability_bonus", hz.denseStabilityBonus);
    r.read("hazard", "collapse_chance_3", hz.collapseChance3);
    r.read("hazard", "collapse_chance_4", hz.collapseChance4);
    r.read("hazard", "collapse_chance_5", hz.collapseChance5);
    r.read("hazard", "collapse_chance_6_plus", hz.collapseChance6Plus);

    return config;
}

bool SimConfig::validate(std::string& error) const {
    if (world.width <= 0 || world.height <= 0) {
        return fail(error, "world dimensions must be positive (" + std::to_string(world.width) +
                           "x" + std::to_string(world.height) + ")");
    }
    // Agents move one tile per tick and combat queries the index built before
    // movement, so a 3x3 cell block must reach two tiles in every direction
    if (world.spatialCellSize < 2) {
        return fail(error, "world.spatial_cell_size must be at least 2 (got " +
                           std::to_string(world.spatialCellSize) + ")");
    }
    if (colony.capacity == 0) {
        return fail(error, "colony.capacity must be at least 1");
    }
    if (spawn.numColonies == 0 || spawn.numColonies > colony.capacity) {
        return fail(error, "spawn.num_colonies (" + std::to_string(spawn.numColonies) +
                           ") must be between 1 and colony.capacity (" +
                           std::to_string(colony.capacity) + ")");
    }
    if (combat.combatInterval == 0 || hazard.caveInInterval == 0 || water.flowInterval == 0 ||
        water.evaporationInterval == 0 || food.regrowInterval == 0 ||
        lifecycle.queenLayInterval == 0 || lifecycle.foodConsumeInterval == 0) {
        return fail(error, "cadence intervals must be non-zero");
    }
    if (!(pheromone.maxStrength > 0.0f)) {
        return fail(error, "pheromone.max_strength must be positive");
    }
    for (float rate : {pheromone.decayFood, pheromone.decayHome, pheromone.decayDanger,
                       pheromone.diffusionRate}) {
        if (rate < 0.0f || rate > 1.0f) {
            return fail(error, "pheromone decay and diffusion rates must lie in [0, 1]");
        }
    }
    if (pheromone.homeDepositRadius <= 0 || pheromone.digDepositRadius <= 0) {
        return fail(error, "pheromone deposit radii must be positive");
    }
    if (water.maxDepth == 0) {
        return fail(error, "water.max_depth must be at least 1");
    }
    if (water.passableThreshold > water.maxDepth || water.dangerousThreshold > water.maxDepth) {
        return fail(error, "water thresholds cannot exceed water.max_depth");
    }
    if (water.rainChance == 0) {
        return fail(error, "water.rain_chance must be at least 1");
    }
    if (water.rainIntensityMin > water.rainIntensityMax ||
        water.rainDurationMin > water.rainDurationMax ||
        water.rainCoverageMin > water.rainCoverageMax) {
        return fail(error, "water rain ranges are inverted");
    }
    if (water.rainDurationMin == 0) {
        return fail(error, "water.rain_duration_min must be at least 1");
    }
    if (world.surfaceRow < 0 || world.surfaceRow >= world.height) {
        return fail(error, "world.surface_row must lie inside the world");
    }
    error.clear();
    return true;
}

} // namespace Formicary
