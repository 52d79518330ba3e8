/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AgentCommandBuffer.hpp"
#include "core/Logger.hpp"
#include "managers/AgentDataManager.hpp"

namespace {

class CommandApplier {
public:
    explicit CommandApplier(AgentDataManager& agents) : m_agents(agents) {}

    bool operator()(const AgentCommand::Move& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr) {
            return false;
        }
        agent->position = cmd.to;
        return true;
    }

    bool operator()(const AgentCommand::Transition& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr) {
            return false;
        }
        if (!agent->requestState(cmd.state)) {
            AGENT_DEBUG(cmd.agent.toString() + " refused " +
                        AgentTraits::stateToString(cmd.state) + " as " +
                        AgentTraits::roleToString(agent->role()));
            return false;
        }
        return true;
    }

    bool operator()(const AgentCommand::Tombstone& cmd) {
        return m_agents.markForDestruction(cmd.agent);
    }

    bool operator()(const AgentCommand::Damage& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr) {
            return false;
        }

        if (agent->health.has_value()) {
            uint8_t current = agent->health->health;
            agent->health->health = current > cmd.amount ? static_cast<uint8_t>(current - cmd.amount) : 0;
        } else {
            uint8_t remaining = cmd.defaultHealth > cmd.amount
                ? static_cast<uint8_t>(cmd.defaultHealth - cmd.amount) : 0;
            agent->health = CombatHealth{cmd.defaultStrength, remaining};
        }

        if (agent->health->health == 0) {
            agent->health.reset();
            m_agents.markForDestruction(cmd.agent);
        }
        return true;
    }

    bool operator()(const AgentCommand::BeginCarry& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr || !agent->behavior.allows(BehaviorState::Carrying)) {
            return false;
        }
        agent->carried = CarriedItem{cmd.amount};
        if (!agent->requestState(BehaviorState::Carrying)) {
            agent->carried.reset();
            return false;
        }
        return true;
    }

    bool operator()(const AgentCommand::EndCarry& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr || !agent->behavior.is(BehaviorState::Carrying)) {
            return false;
        }
        return agent->requestState(BehaviorState::Wandering);
    }

    bool operator()(const AgentCommand::SetSubmersion& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr) {
            return false;
        }
        agent->submersion = SubmersionCounter{cmd.ticks};
        return true;
    }

    bool operator()(const AgentCommand::ClearSubmersion& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr || !agent->submersion.has_value()) {
            return false;
        }
        agent->submersion.reset();
        return true;
    }

    bool operator()(const AgentCommand::SetAge& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr) {
            return false;
        }
        agent->age = cmd.age;
        return true;
    }

    bool operator()(const AgentCommand::Hatch& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr || !agent->behavior.hatch()) {
            return false;
        }
        agent->age = cmd.age;
        return true;
    }

    bool operator()(const AgentCommand::Mature& cmd) {
        Agent* agent = live(cmd.agent);
        if (agent == nullptr || !agent->behavior.mature(cmd.adultRole)) {
            return false;
        }
        agent->age = cmd.age;
        return true;
    }

    bool operator()(const AgentCommand::Spawn& cmd) {
        return m_agents.spawnAgent(cmd.position, cmd.colonyId, cmd.role, cmd.age).isValid();
    }

private:
    Agent* live(AgentHandle handle) {
        Agent* agent = m_agents.getAgent(handle);
        return (agent != nullptr && agent->isAlive()) ? agent : nullptr;
    }

    AgentDataManager& m_agents;
};

} // anonymous namespace

size_t AgentCommandBuffer::apply(AgentDataManager& agents) {
    CommandApplier applier(agents);
    size_t applied = 0;
    for (const Command& command : m_commands) {
        if (std::visit(applier, command)) {
            ++applied;
        }
    }
    m_commands.clear();
    return applied;
}
