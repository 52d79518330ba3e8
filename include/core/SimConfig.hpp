/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIM_CONFIG_HPP
#define SIM_CONFIG_HPP

#include <cstdint>
#include <string>

namespace Formicary {

class SettingsManager;

/**
 * @file SimConfig.hpp
 * @brief Immutable tuning snapshot injected into the simulation at startup
 *
 * Each section mirrors one settings category. Byte-valued chances are rolled
 * against a uniform 0..255 draw ("n out of 256").
 */

struct WorldSettings {
    int32_t width{200};
    int32_t height{100};
    int32_t surfaceRow{20};
    int32_t denseRow{60};
    int32_t bedrockRow{95};
    int32_t spatialCellSize{8};
};

struct ColonySettings {
    uint8_t capacity{6};
    uint32_t initialFood{100};
};

struct PheromoneSettings {
    float maxStrength{1.0f};
    float decayFood{0.02f};
    float decayHome{0.005f};
    float decayDanger{0.05f};
    float snapThreshold{0.001f};
    float depositFood{0.05f};
    float depositHome{0.03f};
    float depositDanger{0.10f};
    float diffusionRate{0.05f};
    int32_t homeDepositRadius{30};
    int32_t digDepositRadius{20};
    float digDepositMultiplier{0.5f};
    float gradientThreshold{0.01f};
};

struct CombatSettings {
    uint8_t baseDamage{10};
    uint32_t combatInterval{5};
    uint8_t soldierStrength{30};
    uint8_t workerStrength{10};
    uint8_t otherStrength{5};
    float dangerDeposit{0.5f};
    uint8_t damageRandomRange{10};
    uint8_t damageOffset{5};
    uint8_t defaultHealth{50};
    uint8_t defaultFighterStrength{10};
    float soldierFightDangerThreshold{0.1f};
    float soldierStopFightThreshold{0.05f};
    float workerFleeDangerThreshold{0.3f};
    float workerStopFleeThreshold{0.1f};
    uint8_t maxColoniesScan{6};
};

struct LifecycleSettings {
    uint32_t eggHatchTime{200};
    uint32_t larvaeMatureTime{300};
    uint32_t queenLayInterval{100};
    uint32_t foodPerEgg{10};
    uint32_t workerLifespan{5000};
    uint32_t soldierLifespan{3000};
    uint32_t queenLifespan{50000};
    uint32_t foodConsumeInterval{50};
    uint32_t larvaeFoodCost{2};
    uint32_t antFoodCost{1};
    uint8_t workerRatioThreshold{204};
};

struct MovementSettings {
    uint8_t queenMoveThreshold{5};
    uint8_t idleMoveThreshold{90};
    uint8_t digChance{8};
    uint8_t reinforceChance{3};
    uint8_t startDigChance{50};
    uint8_t undergroundReturnChance{15};
    uint8_t surfaceReturnChance{3};
    uint8_t digDistractionChance{30};
    uint8_t idleToWanderChance{5};
};

struct FoodSettings {
    uint32_t numSources{15};
    uint32_t initialAmount{100};
    uint32_t regrowInterval{500};
    uint32_t regrowRate{1};
    int32_t depositDistance{3};
    uint32_t foodPerDeposit{10};
    uint32_t foodPerPickup{10};
    float foodPheromoneThreshold{0.01f};
};

struct SpawnSettings {
    uint8_t numColonies{3};
    uint32_t numAphids{10};
    uint32_t initialWorkers{10};
    int32_t minColonyDistance{40};
    float aphidFoodRate{0.1f};
    int32_t aphidNearbyDistance{2};
};

struct WaterSettings {
    uint8_t maxDepth{7};
    uint32_t numSources{5};
    uint8_t passableThreshold{6};
    uint8_t dangerousThreshold{4};
    uint8_t evaporationMaxDepth{2};
    uint32_t stagnantEvaporationTicks{500};
    uint32_t rainChance{10000};
    uint8_t rainIntensityMin{1};
    uint8_t rainIntensityMax{3};
    uint32_t rainDurationMin{200};
    uint32_t rainDurationMax{1000};
    float rainCoverageMin{0.3f};
    float rainCoverageMax{0.8f};
    uint32_t drownThreshold7{1};
    uint32_t drownThreshold6{3};
    uint32_t drownThreshold5{10};
    uint32_t drownThreshold4{30};
    uint8_t fleeFloodDepth{2};
    uint32_t flowInterval{3};
    uint32_t evaporationInterval{50};
    uint8_t upwardPressureMargin{2};
};

struct HazardSettings {
    uint32_t caveInInterval{10};
    uint8_t denseStabilityBonus{2};
    uint8_t collapseChance3{1};
    uint8_t collapseChance4{3};
    uint8_t collapseChance5{10};
    uint8_t collapseChance6Plus{25};
};

struct SimConfig {
    WorldSettings world;
    ColonySettings colony;
    PheromoneSettings pheromone;
    CombatSettings combat;
    LifecycleSettings lifecycle;
    MovementSettings movement;
    FoodSettings food;
    SpawnSettings spawn;
    WaterSettings water;
    HazardSettings hazard;

    /**
     * @brief Checks the cross-field invariants the simulation relies on
     * @param error Receives a description of the first violation
     * @return true when the snapshot is safe to run
     */
    [[nodiscard]] bool validate(std::string& error) const;

    /**
     * @brief Builds a snapshot from loaded settings, defaults fill the gaps
     */
    static SimConfig fromSettings(const SettingsManager& settings);
};

} // namespace Formicary

#endif // SIM_CONFIG_HPP
