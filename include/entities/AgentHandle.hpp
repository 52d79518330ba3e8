/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_HANDLE_HPP
#define AGENT_HANDLE_HPP

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

/**
 * @brief Lightweight reference to an agent owned by AgentDataManager
 *
 * Ids are issued monotonically by the owning manager and never reused, so a
 * handle to a purged agent simply fails lookup. Handles order by id, which is
 * also spawn order; combat uses that ordering to de-duplicate pairs.
 */
struct AgentHandle {
    using IDType = uint64_t;

    static constexpr IDType INVALID_ID = 0;

    IDType id{INVALID_ID};

    constexpr AgentHandle() noexcept = default;
    constexpr explicit AgentHandle(IDType agentId) noexcept : id(agentId) {}

    [[nodiscard]] constexpr bool isValid() const noexcept { return id != INVALID_ID; }

    constexpr bool operator==(const AgentHandle& other) const noexcept { return id == other.id; }
    constexpr bool operator!=(const AgentHandle& other) const noexcept { return id != other.id; }
    constexpr bool operator<(const AgentHandle& other) const noexcept { return id < other.id; }

    [[nodiscard]] std::string toString() const {
        return isValid() ? "Agent#" + std::to_string(id) : "Agent#invalid";
    }
};

inline std::ostream& operator<<(std::ostream& os, const AgentHandle& handle) {
    return os << handle.toString();
}

namespace std {
template<>
struct hash<AgentHandle> {
    size_t operator()(const AgentHandle& handle) const noexcept {
        return hash<uint64_t>{}(handle.id);
    }
};
} // namespace std

#endif // AGENT_HANDLE_HPP
