/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef APHID_CONTROLLER_HPP
#define APHID_CONTROLLER_HPP

/**
 * @file AphidController.hpp
 * @brief Aphid ownership contests and honeydew yield
 *
 * Each aphid counts the workers and soldiers of every colony within the
 * nearby distance. A colony with strictly more ants than any other claims
 * it, a tie leaves ownership alone, and an empty neighbourhood frees it.
 * Owned aphids then credit their yield to the owner's fractional store.
 */

#include "controllers/ControllerBase.hpp"
#include "utils/TileCoord.hpp"
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

struct SimContext;

class AphidController : public ControllerBase
{
public:
    AphidController() = default;
    ~AphidController() override = default;

    AphidController(AphidController&&) noexcept = default;
    AphidController& operator=(AphidController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "AphidController"; }

    /**
     * @brief Resolves ownership for every aphid, then pays out yield
     * @return Number of aphids that changed owner
     */
    size_t updateAphids(SimContext& ctx);

    /**
     * @brief Ownership after one contest
     * @param counts Nearby ants per colony id
     * @param current Owner before the contest
     */
    [[nodiscard]] static std::optional<uint8_t> resolveOwner(const std::vector<uint32_t>& counts,
                                                             std::optional<uint8_t> current);

private:
    std::vector<std::pair<Formicary::TileCoord, uint8_t>> m_farmers;
    std::vector<uint32_t> m_counts;
};

#endif // APHID_CONTROLLER_HPP
