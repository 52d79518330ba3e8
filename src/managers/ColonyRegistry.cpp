/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ColonyRegistry.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <limits>

uint8_t ColonyRegistry::addColony(Formicary::TileCoord home, uint32_t initialFood) {
    if (m_colonies.size() >= m_capacity) {
        COLONY_ERROR("Colony capacity " + std::to_string(m_capacity) + " reached, colony rejected");
        return m_capacity;
    }

    ColonyState colony;
    colony.id = static_cast<uint8_t>(m_colonies.size());
    colony.home = home;
    colony.foodStored = initialFood;
    m_colonies.push_back(colony);

    COLONY_INFO("Colony " + std::to_string(colony.id) + " founded at (" +
                std::to_string(home.x) + ", " + std::to_string(home.y) + ")");
    return colony.id;
}

ColonyState* ColonyRegistry::get(uint8_t colonyId) {
    return colonyId < m_colonies.size() ? &m_colonies[colonyId] : nullptr;
}

const ColonyState* ColonyRegistry::get(uint8_t colonyId) const {
    return colonyId < m_colonies.size() ? &m_colonies[colonyId] : nullptr;
}

void ColonyRegistry::addFood(uint8_t colonyId, uint32_t amount) {
    ColonyState* colony = get(colonyId);
    if (colony == nullptr) {
        return;
    }
    uint32_t headroom = std::numeric_limits<uint32_t>::max() - colony->foodStored;
    colony->foodStored += amount < headroom ? amount : headroom;
}

uint32_t ColonyRegistry::consumeFood(uint8_t colonyId, uint32_t amount) {
    ColonyState* colony = get(colonyId);
    if (colony == nullptr) {
        return 0;
    }
    uint32_t taken = amount < colony->foodStored ? amount : colony->foodStored;
    colony->foodStored -= taken;
    return taken;
}

void ColonyRegistry::creditFractionalFood(uint8_t colonyId, float amount) {
    ColonyState* colony = get(colonyId);
    if (colony == nullptr || !(amount > 0.0f)) {
        return;
    }
    colony->pendingFood += amount;
    float whole = std::floor(colony->pendingFood);
    if (whole >= 1.0f) {
        colony->pendingFood -= whole;
        addFood(colonyId, static_cast<uint32_t>(whole));
    }
}

void ColonyRegistry::markQueenDead(uint8_t colonyId) {
    ColonyState* colony = get(colonyId);
    if (colony != nullptr && colony->queenAlive) {
        colony->queenAlive = false;
        COLONY_INFO("Colony " + std::to_string(colonyId) + " lost its queen");
    }
}
