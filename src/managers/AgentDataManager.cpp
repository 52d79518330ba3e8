/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AgentDataManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>

using Formicary::TileCoord;

AgentHandle AgentDataManager::spawnAgent(TileCoord position, uint8_t colonyId, AgentRole role,
                                         std::optional<AgeCounter> age) {
    AgentHandle handle(m_nextId++);
    m_agents.emplace_back(handle, position, colonyId, AgentBehavior::forRole(role));
    m_agents.back().age = age;
    m_idToIndex[handle.id] = m_agents.size() - 1;
    return handle;
}

Agent* AgentDataManager::getAgent(AgentHandle handle) {
    auto it = m_idToIndex.find(handle.id);
    return it == m_idToIndex.end() ? nullptr : &m_agents[it->second];
}

const Agent* AgentDataManager::getAgent(AgentHandle handle) const {
    auto it = m_idToIndex.find(handle.id);
    return it == m_idToIndex.end() ? nullptr : &m_agents[it->second];
}

bool AgentDataManager::isValidHandle(AgentHandle handle) const {
    return handle.isValid() && m_idToIndex.find(handle.id) != m_idToIndex.end();
}

bool AgentDataManager::markForDestruction(AgentHandle handle) {
    Agent* agent = getAgent(handle);
    if (agent == nullptr || agent->deathMark) {
        return false;
    }
    agent->deathMark = true;
    return true;
}

size_t AgentDataManager::processDestructionQueue(const RemovalCallback& onRemoved) {
    if (onRemoved) {
        for (const Agent& agent : m_agents) {
            if (agent.deathMark) {
                onRemoved(agent);
            }
        }
    }

    size_t before = m_agents.size();
    m_agents.erase(std::remove_if(m_agents.begin(), m_agents.end(),
                                  [](const Agent& agent) { return agent.deathMark; }),
                   m_agents.end());
    size_t removed = before - m_agents.size();
    if (removed == 0) {
        return 0;
    }
    rebuildIndex();

    AGENT_DEBUG("Purged " + std::to_string(removed) + " agents, " +
                std::to_string(m_agents.size()) + " remain");
    return removed;
}

size_t AgentDataManager::countLive(uint8_t colonyId, AgentRole role) const {
    return static_cast<size_t>(std::count_if(m_agents.begin(), m_agents.end(),
        [colonyId, role](const Agent& agent) {
            return !agent.deathMark && agent.colonyId == colonyId && agent.role() == role;
        }));
}

uint32_t AgentDataManager::addFoodSource(TileCoord position, uint32_t amount, uint32_t regrowRate) {
    FoodSource source;
    source.id = static_cast<uint32_t>(m_foodSources.size());
    source.position = position;
    source.amount = amount;
    source.regrowRate = regrowRate;
    source.spawnAmount = amount;
    m_foodSources.push_back(source);
    return source.id;
}

uint32_t AgentDataManager::addAphid(TileCoord position, float productionRate) {
    Aphid aphid;
    aphid.id = static_cast<uint32_t>(m_aphids.size());
    aphid.position = position;
    aphid.productionRate = productionRate;
    m_aphids.push_back(aphid);
    return aphid.id;
}

void AgentDataManager::clear() {
    m_agents.clear();
    m_idToIndex.clear();
    m_foodSources.clear();
    m_aphids.clear();
    m_nextId = 1;
}

void AgentDataManager::rebuildIndex() {
    m_idToIndex.clear();
    m_idToIndex.reserve(m_agents.size());
    for (size_t i = 0; i < m_agents.size(); ++i) {
        m_idToIndex[m_agents[i].handle.id] = i;
    }
}
