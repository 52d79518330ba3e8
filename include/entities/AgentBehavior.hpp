/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_BEHAVIOR_HPP
#define AGENT_BEHAVIOR_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <variant>

enum class AgentRole : uint8_t {
    Queen = 0,
    Worker,
    Soldier,
    Egg,
    Larvae,
    COUNT
};

enum class BehaviorState : uint8_t {
    Idle = 0,
    Wandering,
    Digging,
    Returning,
    Carrying,
    Fighting,
    Fleeing,
    Following
};

namespace AgentTraits {

constexpr bool isBrood(AgentRole role) noexcept {
    return role == AgentRole::Egg || role == AgentRole::Larvae;
}

/// Roles that take part in combat and count towards aphid claims
constexpr bool isCombatant(AgentRole role) noexcept {
    return role == AgentRole::Worker || role == AgentRole::Soldier;
}

constexpr const char* roleToString(AgentRole role) noexcept {
    switch (role) {
        case AgentRole::Queen:   return "Queen";
        case AgentRole::Worker:  return "Worker";
        case AgentRole::Soldier: return "Soldier";
        case AgentRole::Egg:     return "Egg";
        case AgentRole::Larvae:  return "Larvae";
        default:                 return "Unknown";
    }
}

constexpr const char* stateToString(BehaviorState state) noexcept {
    switch (state) {
        case BehaviorState::Idle:      return "Idle";
        case BehaviorState::Wandering: return "Wandering";
        case BehaviorState::Digging:   return "Digging";
        case BehaviorState::Returning: return "Returning";
        case BehaviorState::Carrying:  return "Carrying";
        case BehaviorState::Fighting:  return "Fighting";
        case BehaviorState::Fleeing:   return "Fleeing";
        case BehaviorState::Following: return "Following";
        default:                       return "Unknown";
    }
}

} // namespace AgentTraits

inline std::ostream& operator<<(std::ostream& os, AgentRole role) {
    return os << AgentTraits::roleToString(role);
}

inline std::ostream& operator<<(std::ostream& os, BehaviorState state) {
    return os << AgentTraits::stateToString(state);
}

// Per-role behaviours. Each one only has the states that role can be in.

struct QueenBehavior {
    enum class State : uint8_t { Idle, Returning };
    State state{State::Idle};
};

struct WorkerBehavior {
    enum class State : uint8_t { Idle, Wandering, Digging, Returning, Carrying, Fleeing, Following };
    State state{State::Wandering};
};

struct SoldierBehavior {
    enum class State : uint8_t { Idle, Wandering, Returning, Fighting };
    State state{State::Wandering};
};

struct EggBehavior {};
struct LarvaeBehavior {};

/**
 * @brief Role plus behaviour state as a single tagged union
 *
 * Role and state cannot disagree: an Egg has no state to set, a Queen cannot
 * be Carrying. transitionTo() is the only way to change state and refuses
 * anything the role does not allow. Role changes go through hatch() and
 * mature(), which are the only legal promotions.
 */
class AgentBehavior {
public:
    using Variant = std::variant<QueenBehavior, WorkerBehavior, SoldierBehavior,
                                 EggBehavior, LarvaeBehavior>;

    /// Role in its spawn state: queens Idle, workers and soldiers Wandering
    static AgentBehavior forRole(AgentRole role);

    [[nodiscard]] AgentRole role() const noexcept {
        return static_cast<AgentRole>(m_behavior.index());
    }

    /// Brood always reports Idle
    [[nodiscard]] BehaviorState state() const noexcept;

    [[nodiscard]] bool is(BehaviorState state) const noexcept { return this->state() == state; }

    /// Whether this role has the given state at all
    [[nodiscard]] bool allows(BehaviorState state) const noexcept;

    /**
     * @brief Moves to a new state if the role allows it
     * @return false and leaves the behaviour untouched when illegal
     */
    bool transitionTo(BehaviorState state) noexcept;

    /// Egg to Larvae, false for any other role
    bool hatch() noexcept;

    /// Larvae to Worker or Soldier in Wandering, false otherwise
    bool mature(AgentRole adultRole) noexcept;

private:
    explicit AgentBehavior(Variant behavior) : m_behavior(behavior) {}

    Variant m_behavior;
};

#endif // AGENT_BEHAVIOR_HPP
