/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/AgentBehavior.hpp"

namespace {

std::optional<QueenBehavior::State> toQueenState(BehaviorState state) {
    switch (state) {
        case BehaviorState::Idle:      return QueenBehavior::State::Idle;
        case BehaviorState::Returning: return QueenBehavior::State::Returning;
        default:                       return std::nullopt;
    }
}

std::optional<WorkerBehavior::State> toWorkerState(BehaviorState state) {
    using S = WorkerBehavior::State;
    switch (state) {
        case BehaviorState::Idle:      return S::Idle;
        case BehaviorState::Wandering: return S::Wandering;
        case BehaviorState::Digging:   return S::Digging;
        case BehaviorState::Returning: return S::Returning;
        case BehaviorState::Carrying:  return S::Carrying;
        case BehaviorState::Fleeing:   return S::Fleeing;
        case BehaviorState::Following: return S::Following;
        default:                       return std::nullopt;
    }
}

std::optional<SoldierBehavior::State> toSoldierState(BehaviorState state) {
    using S = SoldierBehavior::State;
    switch (state) {
        case BehaviorState::Idle:      return S::Idle;
        case BehaviorState::Wandering: return S::Wandering;
        case BehaviorState::Returning: return S::Returning;
        case BehaviorState::Fighting:  return S::Fighting;
        default:                       return std::nullopt;
    }
}

BehaviorState fromQueenState(QueenBehavior::State state) {
    return state == QueenBehavior::State::Returning ? BehaviorState::Returning
                                                    : BehaviorState::Idle;
}

BehaviorState fromWorkerState(WorkerBehavior::State state) {
    using S = WorkerBehavior::State;
    switch (state) {
        case S::Wandering: return BehaviorState::Wandering;
        case S::Digging:   return BehaviorState::Digging;
        case S::Returning: return BehaviorState::Returning;
        case S::Carrying:  return BehaviorState::Carrying;
        case S::Fleeing:   return BehaviorState::Fleeing;
        case S::Following: return BehaviorState::Following;
        case S::Idle:
        default:           return BehaviorState::Idle;
    }
}

BehaviorState fromSoldierState(SoldierBehavior::State state) {
    using S = SoldierBehavior::State;
    switch (state) {
        case S::Wandering: return BehaviorState::Wandering;
        case S::Returning: return BehaviorState::Returning;
        case S::Fighting:  return BehaviorState::Fighting;
        case S::Idle:
        default:           return BehaviorState::Idle;
    }
}

} // anonymous namespace

AgentBehavior AgentBehavior::forRole(AgentRole role) {
    switch (role) {
        case AgentRole::Queen:   return AgentBehavior(QueenBehavior{});
        case AgentRole::Worker:  return AgentBehavior(WorkerBehavior{});
        case AgentRole::Soldier: return AgentBehavior(SoldierBehavior{});
        case AgentRole::Larvae:  return AgentBehavior(LarvaeBehavior{});
        case AgentRole::Egg:
        default:                 return AgentBehavior(EggBehavior{});
    }
}

BehaviorState AgentBehavior::state() const noexcept {
    if (const auto* queen = std::get_if<QueenBehavior>(&m_behavior)) {
        return fromQueenState(queen->state);
    }
    if (const auto* worker = std::get_if<WorkerBehavior>(&m_behavior)) {
        return fromWorkerState(worker->state);
    }
    if (const auto* soldier = std::get_if<SoldierBehavior>(&m_behavior)) {
        return fromSoldierState(soldier->state);
    }
    return BehaviorState::Idle;
}

bool AgentBehavior::allows(BehaviorState state) const noexcept {
    switch (role()) {
        case AgentRole::Queen:   return toQueenState(state).has_value();
        case AgentRole::Worker:  return toWorkerState(state).has_value();
        case AgentRole::Soldier: return toSoldierState(state).has_value();
        default:                 return state == BehaviorState::Idle;
    }
}

bool AgentBehavior::transitionTo(BehaviorState state) noexcept {
    if (auto* queen = std::get_if<QueenBehavior>(&m_behavior)) {
        if (auto next = toQueenState(state)) {
            queen->state = *next;
            return true;
        }
        return false;
    }
    if (auto* worker = std::get_if<WorkerBehavior>(&m_behavior)) {
        if (auto next = toWorkerState(state)) {
            worker->state = *next;
            return true;
        }
        return false;
    }
    if (auto* soldier = std::get_if<SoldierBehavior>(&m_behavior)) {
        if (auto next = toSoldierState(state)) {
            soldier->state = *next;
            return true;
        }
        return false;
    }
    // Brood has no states beyond Idle
    return state == BehaviorState::Idle;
}

bool AgentBehavior::hatch() noexcept {
    if (!std::holds_alternative<EggBehavior>(m_behavior)) {
        return false;
    }
    m_behavior = LarvaeBehavior{};
    return true;
}

bool AgentBehavior::mature(AgentRole adultRole) noexcept {
    if (!std::holds_alternative<LarvaeBehavior>(m_behavior)) {
        return false;
    }
    if (adultRole == AgentRole::Worker) {
        m_behavior = WorkerBehavior{WorkerBehavior::State::Wandering};
        return true;
    }
    if (adultRole == AgentRole::Soldier) {
        m_behavior = SoldierBehavior{SoldierBehavior::State::Wandering};
        return true;
    }
    return false;
}
