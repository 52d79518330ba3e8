/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_COMMAND_BUFFER_HPP
#define AGENT_COMMAND_BUFFER_HPP

#include "entities/AgentData.hpp"
#include <cstddef>
#include <variant>
#include <vector>

class AgentDataManager;

namespace AgentCommand {

struct Move {
    AgentHandle agent;
    Formicary::TileCoord to;
};

struct Transition {
    AgentHandle agent;
    BehaviorState state;
};

struct Tombstone {
    AgentHandle agent;
};

/// Health is attached on first hit with the role-independent defaults
struct Damage {
    AgentHandle agent;
    uint8_t amount;
    uint8_t defaultHealth;
    uint8_t defaultStrength;
};

struct BeginCarry {
    AgentHandle agent;
    uint32_t amount;
};

/// Drops the item and returns to Wandering
struct EndCarry {
    AgentHandle agent;
};

struct SetSubmersion {
    AgentHandle agent;
    uint32_t ticks;
};

struct ClearSubmersion {
    AgentHandle agent;
};

/// Replaces the age counter, used for the per-tick ageing pass
struct SetAge {
    AgentHandle agent;
    AgeCounter age;
};

struct Hatch {
    AgentHandle agent;
    AgeCounter age;
};

struct Mature {
    AgentHandle agent;
    AgentRole adultRole;
    AgeCounter age;
};

struct Spawn {
    Formicary::TileCoord position;
    uint8_t colonyId;
    AgentRole role;
    AgeCounter age;
};

} // namespace AgentCommand

/**
 * @brief Deferred agent mutations gathered during a read pass
 *
 * Systems read the world, push commands, then call apply() once the pass is
 * done. Commands run in insertion order. Commands addressed to agents that
 * no longer exist or are already tombstoned are dropped.
 */
class AgentCommandBuffer {
public:
    using Command = std::variant<AgentCommand::Move, AgentCommand::Transition,
                                 AgentCommand::Tombstone, AgentCommand::Damage,
                                 AgentCommand::BeginCarry, AgentCommand::EndCarry,
                                 AgentCommand::SetSubmersion, AgentCommand::ClearSubmersion,
                                 AgentCommand::SetAge, AgentCommand::Hatch, AgentCommand::Mature,
                                 AgentCommand::Spawn>;

    template<typename T>
    void push(T&& command) {
        m_commands.emplace_back(std::forward<T>(command));
    }

    /**
     * @brief Applies and clears all queued commands
     * @return Number of commands that took effect
     */
    size_t apply(AgentDataManager& agents);

    [[nodiscard]] size_t size() const noexcept { return m_commands.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_commands.empty(); }
    [[nodiscard]] const std::vector<Command>& commands() const noexcept { return m_commands; }

    void clear() { m_commands.clear(); }

private:
    std::vector<Command> m_commands;
};

#endif // AGENT_COMMAND_BUFFER_HPP
