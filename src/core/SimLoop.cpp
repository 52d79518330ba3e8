/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimLoop.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>

SimLoop::SimLoop(float targetFPS, uint32_t speed)
    : m_timestepManager(std::make_unique<TimestepManager>(targetFPS))
    , m_running(false)
    , m_paused(false)
    , m_stopRequested(false)
    , m_speed(std::max<uint32_t>(speed, 1))
    , m_ticksRun(0)
{
}

void SimLoop::setTickHandler(TickHandler handler) {
    m_tickHandler = std::move(handler);
}

void SimLoop::setFrameHandler(FrameHandler handler) {
    m_frameHandler = std::move(handler);
}

bool SimLoop::run(uint64_t maxTicks) {
    if (m_running.load()) {
        SIMLOOP_WARN("SimLoop already running");
        return false;
    }
    if (!m_tickHandler) {
        SIMLOOP_ERROR("No tick handler set");
        return false;
    }

    m_running.store(true, std::memory_order_relaxed);
    m_stopRequested.store(false, std::memory_order_relaxed);
    m_timestepManager->reset();

    SIMLOOP_INFO("Running " + (maxTicks > 0 ? std::to_string(maxTicks) + " ticks" : std::string("until stopped")) +
                 " at " + std::to_string(m_speed) + " ticks per frame");

    try {
        while (!m_stopRequested.load(std::memory_order_relaxed)) {
            m_timestepManager->startFrame();

            if (!m_paused.load(std::memory_order_relaxed)) {
                for (uint32_t i = 0; i < m_speed; ++i) {
                    if (maxTicks > 0 && m_ticksRun >= maxTicks) {
                        break;
                    }
                    m_tickHandler();
                    ++m_ticksRun;
                }
            }

            if (m_frameHandler) {
                m_frameHandler(m_ticksRun);
            }

            if (maxTicks > 0 && m_ticksRun >= maxTicks) {
                break;
            }

            m_timestepManager->endFrame();
        }
    } catch (const std::exception& e) {
        SIMLOOP_CRITICAL("Exception in simulation loop: " + std::string(e.what()));
        m_running.store(false, std::memory_order_relaxed);
        return false;
    }

    m_running.store(false, std::memory_order_relaxed);
    SIMLOOP_INFO("Stopped after " + std::to_string(m_ticksRun) + " ticks");
    return true;
}

void SimLoop::stop() {
    m_stopRequested.store(true, std::memory_order_relaxed);
}

bool SimLoop::isRunning() const {
    return m_running.load(std::memory_order_relaxed);
}

void SimLoop::setPaused(bool paused) {
    m_paused.store(paused, std::memory_order_relaxed);
    if (!paused) {
        m_timestepManager->reset();
    }
}

bool SimLoop::isPaused() const {
    return m_paused.load(std::memory_order_relaxed);
}

void SimLoop::setSpeed(uint32_t speed) {
    m_speed = std::max<uint32_t>(speed, 1);
}

TimestepManager& SimLoop::getTimestepManager() {
    return *m_timestepManager;
}
