/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLONY_REGISTRY_HPP
#define COLONY_REGISTRY_HPP

#include "utils/TileCoord.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

struct ColonyState {
    uint8_t id{0};
    Formicary::TileCoord home;
    uint32_t foodStored{0};
    bool queenAlive{true};
    // Fractional aphid yield not yet banked as whole food units
    float pendingFood{0.0f};
};

/**
 * @brief Ordered colony records, indexed by colony id
 *
 * Colonies are never removed. A colony whose queen died keeps its record
 * with queenAlive cleared.
 */
class ColonyRegistry {
public:
    explicit ColonyRegistry(uint8_t capacity = 6) : m_capacity(capacity) {}

    /**
     * @brief Appends a colony with the next id
     * @return The new id, or capacity() when the registry is full
     */
    uint8_t addColony(Formicary::TileCoord home, uint32_t initialFood);

    [[nodiscard]] ColonyState* get(uint8_t colonyId);
    [[nodiscard]] const ColonyState* get(uint8_t colonyId) const;

    [[nodiscard]] size_t size() const noexcept { return m_colonies.size(); }
    [[nodiscard]] uint8_t capacity() const noexcept { return m_capacity; }

    [[nodiscard]] std::vector<ColonyState>& colonies() noexcept { return m_colonies; }
    [[nodiscard]] const std::vector<ColonyState>& colonies() const noexcept { return m_colonies; }

    void addFood(uint8_t colonyId, uint32_t amount);

    /// Saturating, returns what was actually taken
    uint32_t consumeFood(uint8_t colonyId, uint32_t amount);

    /// Banks fractional yield, moving whole units into foodStored
    void creditFractionalFood(uint8_t colonyId, float amount);

    void markQueenDead(uint8_t colonyId);

    void clear() { m_colonies.clear(); }

private:
    uint8_t m_capacity;
    std::vector<ColonyState> m_colonies;
};

#endif // COLONY_REGISTRY_HPP
