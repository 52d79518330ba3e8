/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

/**
 * TimestepManager paces the headless simulation loop.
 *
 * Each frame is bracketed by startFrame()/endFrame(). endFrame() sleeps out
 * the rest of the frame budget with SDL_DelayPrecise. A target rate of 0
 * disables pacing so batch runs go as fast as the CPU allows.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Frames per second to pace to, 0 for unpaced
     */
    explicit TimestepManager(float targetFPS = 30.0f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Call this at the end of each frame.
     * Sleeps until the frame budget is used up.
     */
    void endFrame();

    /**
     * Get current measured frames per second (EMA smoothed)
     */
    float getCurrentFPS() const;

    float getTargetFPS() const;

    /**
     * Get last frame time in milliseconds
     */
    uint32_t getFrameTimeMs() const;

    /**
     * Set new target FPS, 0 disables pacing
     */
    void setTargetFPS(float fps);

    bool isPaced() const { return m_targetFPS > 0.0f; }

    /**
     * Reset timing state (used when resuming from pause)
     */
    void reset();

private:
    float m_targetFPS;
    double m_targetFrameTime;            // Seconds per frame, 0 when unpaced

    std::chrono::high_resolution_clock::time_point m_frameStart;
    std::chrono::high_resolution_clock::time_point m_lastFrameTime;

    uint32_t m_lastFrameTimeMs;
    double m_lastDeltaSeconds;
    float m_currentFPS;
    float m_smoothingAlpha;
    bool m_firstFrame;

    void updateFPS();
    void limitFrameRate() const;
};

#endif // TIMESTEP_MANAGER_HPP
