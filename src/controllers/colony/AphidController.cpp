/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/colony/AphidController.hpp"
#include "core/Logger.hpp"
#include "core/SimContext.hpp"
#include "managers/AgentDataManager.hpp"
#include "managers/ColonyRegistry.hpp"
#include <algorithm>

std::optional<uint8_t> AphidController::resolveOwner(const std::vector<uint32_t>& counts,
                                                     std::optional<uint8_t> current)
{
    uint32_t best = 0;
    std::optional<uint8_t> leader;
    bool tied = false;

    for (size_t id = 0; id < counts.size(); ++id) {
        if (counts[id] > best) {
            best = counts[id];
            leader = static_cast<uint8_t>(id);
            tied = false;
        } else if (counts[id] == best && best > 0) {
            tied = true;
        }
    }

    if (best == 0) {
        return std::nullopt;
    }
    return tied ? current : leader;
}

size_t AphidController::updateAphids(SimContext& ctx)
{
    const auto& spawn = ctx.config.spawn;

    m_farmers.clear();
    for (const Agent& agent : ctx.agents.agents()) {
        if (agent.isAlive() && AgentTraits::isCombatant(agent.role())) {
            m_farmers.emplace_back(agent.position, agent.colonyId);
        }
    }

    size_t changed = 0;
    for (Aphid& aphid : ctx.agents.aphids()) {
        m_counts.assign(ctx.colonies.capacity(), 0);
        for (const auto& [pos, colony] : m_farmers) {
            if (colony < m_counts.size() &&
                Formicary::manhattanDistance(pos, aphid.position) <= spawn.aphidNearbyDistance) {
                ++m_counts[colony];
            }
        }

        std::optional<uint8_t> owner = resolveOwner(m_counts, aphid.ownerColony);
        if (owner != aphid.ownerColony) {
            APHID_DEBUG("Aphid " + std::to_string(aphid.id) + " now owned by " +
                        (owner ? "colony " + std::to_string(*owner) : std::string("nobody")));
            aphid.ownerColony = owner;
            ++changed;
        }

        if (aphid.ownerColony) {
            ctx.colonies.creditFractionalFood(*aphid.ownerColony, aphid.productionRate);
        }
    }

    return changed;
}
