/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Common base for the per-tick agent and world controllers
 *
 * Controllers are stateless between ticks apart from scratch buffers they
 * reuse to avoid per-tick allocation. ColonySimulation owns one of each and
 * calls their phase methods in a fixed order.
 */

#include <string_view>

class ControllerBase
{
public:
    virtual ~ControllerBase() = default;

    // Scratch buffers are per-instance, no sharing
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    ControllerBase(ControllerBase&&) noexcept = default;
    ControllerBase& operator=(ControllerBase&&) noexcept = default;

    /**
     * @brief Controller name for logging
     */
    [[nodiscard]] virtual std::string_view getName() const = 0;

protected:
    ControllerBase() = default;
};

#endif // CONTROLLER_BASE_HPP
