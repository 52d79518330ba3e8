/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

TimestepManager::TimestepManager(float targetFPS)
    : m_targetFPS(0.0f)
    , m_targetFrameTime(0.0)
    , m_lastFrameTimeMs(0)
    , m_lastDeltaSeconds(0.0)
    , m_currentFPS(0.0f)
    , m_smoothingAlpha(0.03f)
    , m_firstFrame(true)
{
    setTargetFPS(targetFPS);
    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::startFrame() {
    auto currentTime = std::chrono::high_resolution_clock::now();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        m_frameStart = currentTime;
        return;
    }

    auto deltaTimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(currentTime - m_lastFrameTime);
    double deltaTimeMs = static_cast<double>(deltaTimeNs.count()) / 1000000.0;
    m_lastFrameTime = currentTime;
    m_frameStart = currentTime;

    m_lastFrameTimeMs = static_cast<uint32_t>(deltaTimeMs);
    m_lastDeltaSeconds = deltaTimeMs / 1000.0;

    updateFPS();
}

void TimestepManager::endFrame() {
    limitFrameRate();
}

float TimestepManager::getCurrentFPS() const {
    return m_currentFPS;
}

float TimestepManager::getTargetFPS() const {
    return m_targetFPS;
}

uint32_t TimestepManager::getFrameTimeMs() const {
    return m_lastFrameTimeMs;
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTime = 1.0 / static_cast<double>(fps);
    } else {
        m_targetFPS = 0.0f;
        m_targetFrameTime = 0.0;
    }
}

void TimestepManager::reset() {
    m_firstFrame = true;
    m_currentFPS = 0.0f;
    m_lastDeltaSeconds = 0.0;

    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::updateFPS() {
    if (m_lastDeltaSeconds > 0.0) {
        float instantFPS = static_cast<float>(1.0 / m_lastDeltaSeconds);
        instantFPS = std::clamp(instantFPS, 0.1f, 10000.0f);

        if (m_currentFPS <= 0.0f) {
            m_currentFPS = instantFPS;
        } else {
            m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
        }
    }
}

void TimestepManager::limitFrameRate() const {
    if (!isPaced()) {
        return;
    }

    // Absolute end time for this frame, measured from startFrame()
    int64_t targetFrameNs = static_cast<int64_t>(m_targetFrameTime * 1e9);
    auto targetEndTime = m_frameStart + std::chrono::nanoseconds(targetFrameNs);

    auto now = std::chrono::high_resolution_clock::now();
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEndTime - now);

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}
