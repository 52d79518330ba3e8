/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_DATA_MANAGER_HPP
#define AGENT_DATA_MANAGER_HPP

#include "entities/AgentData.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

/**
 * @brief Owns every agent, food source and aphid in one simulation
 *
 * Agents live in a dense vector addressed through an id-to-index map. Death
 * is deferred: markForDestruction() only sets the tombstone, and
 * processDestructionQueue() removes tombstoned agents in one sweep at the
 * end of the tick, so indices and the spatial grid stay valid mid-phase.
 *
 * One instance per ColonySimulation; tests build their own.
 */
class AgentDataManager {
public:
    using RemovalCallback = std::function<void(const Agent&)>;

    AgentDataManager() = default;

    AgentHandle spawnAgent(Formicary::TileCoord position, uint8_t colonyId, AgentRole role,
                           std::optional<AgeCounter> age = std::nullopt);

    [[nodiscard]] Agent* getAgent(AgentHandle handle);
    [[nodiscard]] const Agent* getAgent(AgentHandle handle) const;
    [[nodiscard]] bool isValidHandle(AgentHandle handle) const;

    /**
     * @brief Tombstones an agent
     * @return false if the handle is unknown or already tombstoned
     */
    bool markForDestruction(AgentHandle handle);

    /**
     * @brief Removes every tombstoned agent
     * @param onRemoved Invoked with each record before it is erased
     * @return Number of agents removed
     */
    size_t processDestructionQueue(const RemovalCallback& onRemoved = {});

    [[nodiscard]] std::vector<Agent>& agents() noexcept { return m_agents; }
    [[nodiscard]] const std::vector<Agent>& agents() const noexcept { return m_agents; }

    [[nodiscard]] size_t getAgentCount() const noexcept { return m_agents.size(); }

    /// Live (not tombstoned) agents of a colony and role
    [[nodiscard]] size_t countLive(uint8_t colonyId, AgentRole role) const;

    uint32_t addFoodSource(Formicary::TileCoord position, uint32_t amount, uint32_t regrowRate);
    [[nodiscard]] std::vector<FoodSource>& foodSources() noexcept { return m_foodSources; }
    [[nodiscard]] const std::vector<FoodSource>& foodSources() const noexcept { return m_foodSources; }

    uint32_t addAphid(Formicary::TileCoord position, float productionRate);
    [[nodiscard]] std::vector<Aphid>& aphids() noexcept { return m_aphids; }
    [[nodiscard]] const std::vector<Aphid>& aphids() const noexcept { return m_aphids; }

    void clear();

private:
    void rebuildIndex();

    std::vector<Agent> m_agents;
    std::unordered_map<AgentHandle::IDType, size_t> m_idToIndex;
    AgentHandle::IDType m_nextId{1};

    std::vector<FoodSource> m_foodSources;
    std::vector<Aphid> m_aphids;
};

#endif // AGENT_DATA_MANAGER_HPP
