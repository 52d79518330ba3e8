/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_DATA_HPP
#define AGENT_DATA_HPP

#include "entities/AgentBehavior.hpp"
#include "entities/AgentHandle.hpp"
#include "utils/TileCoord.hpp"
#include <cstdint>
#include <optional>

/**
 * @file AgentData.hpp
 * @brief Agent records and the optional capabilities attached to them
 *
 * Capabilities are plain optionals on the record. Presence is the signal:
 * an agent without CombatHealth has never been hit, one without
 * SubmersionCounter is not currently in dangerous water.
 */

struct AgeCounter {
    uint32_t ticks{0};
    uint32_t maxTicks{0};
};

struct CombatHealth {
    uint8_t strength{0};
    uint8_t health{0};
};

struct CarriedItem {
    uint32_t amount{0};
};

/// Consecutive ticks spent at or above the dangerous water depth
struct SubmersionCounter {
    uint32_t ticks{0};
};

struct Agent {
    AgentHandle handle;
    Formicary::TileCoord position;
    uint8_t colonyId{0};
    AgentBehavior behavior;

    std::optional<AgeCounter> age;
    std::optional<CombatHealth> health;
    std::optional<CarriedItem> carried;
    std::optional<SubmersionCounter> submersion;

    // Tombstone, removed by the end-of-tick sweep
    bool deathMark{false};

    Agent(AgentHandle h, Formicary::TileCoord pos, uint8_t colony, AgentBehavior b)
        : handle(h), position(pos), colonyId(colony), behavior(b) {}

    [[nodiscard]] AgentRole role() const noexcept { return behavior.role(); }
    [[nodiscard]] BehaviorState state() const noexcept { return behavior.state(); }
    [[nodiscard]] bool isAlive() const noexcept { return !deathMark; }

    /**
     * @brief Single entry point for state changes on a live record
     *
     * Refuses states the role does not have. Carrying can only be entered
     * with a CarriedItem already attached, and leaving it drops the item.
     */
    bool requestState(BehaviorState next) noexcept {
        if (next == BehaviorState::Carrying && !carried.has_value()) {
            return false;
        }
        bool wasCarrying = behavior.is(BehaviorState::Carrying);
        if (!behavior.transitionTo(next)) {
            return false;
        }
        if (wasCarrying && next != BehaviorState::Carrying) {
            carried.reset();
        }
        return true;
    }
};

/// Food node on the surface
struct FoodSource {
    uint32_t id{0};
    Formicary::TileCoord position;
    uint32_t amount{0};
    uint32_t regrowRate{0};
    uint32_t spawnAmount{0};
};

/// Farmable aphid, claimed by whichever colony crowds it most
struct Aphid {
    uint32_t id{0};
    Formicary::TileCoord position;
    float productionRate{0.0f};
    std::optional<uint8_t> ownerColony;
};

#endif // AGENT_DATA_HPP
