/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIM_LOOP_HPP
#define SIM_LOOP_HPP

#include "core/TimestepManager.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

/**
 * SimLoop drives the simulation frame by frame.
 *
 * Each frame runs the tick handler `speed` times in a row (never
 * interleaved, never partial), then the frame handler once. Pausing skips
 * the ticks but keeps frames coming. Everything runs on the calling thread.
 */
class SimLoop {
public:
    // Callback function types
    using TickHandler = std::function<void()>;
    using FrameHandler = std::function<void(uint64_t ticksRun)>;

    /**
     * Constructor
     * @param targetFPS Frames per second, 0 runs unpaced
     * @param speed Ticks per frame
     */
    explicit SimLoop(float targetFPS = 30.0f, uint32_t speed = 1);

    ~SimLoop() = default;

    void setTickHandler(TickHandler handler);

    /**
     * Called once per frame after the frame's ticks, with the running total
     */
    void setFrameHandler(FrameHandler handler);

    /**
     * Run until maxTicks ticks have run or stop() is called
     * @param maxTicks 0 runs until stopped
     * @return false if a handler threw
     */
    bool run(uint64_t maxTicks);

    /**
     * Stop after the current frame. Safe to call from a signal handler.
     */
    void stop();

    bool isRunning() const;

    void setPaused(bool paused);
    bool isPaused() const;

    /**
     * Ticks per frame, clamped to at least 1
     */
    void setSpeed(uint32_t speed);
    uint32_t getSpeed() const { return m_speed; }

    uint64_t getTicksRun() const { return m_ticksRun; }

    TimestepManager& getTimestepManager();

private:
    std::unique_ptr<TimestepManager> m_timestepManager;

    TickHandler m_tickHandler;
    FrameHandler m_frameHandler;

    std::atomic<bool> m_running;
    std::atomic<bool> m_paused;
    std::atomic<bool> m_stopRequested;

    uint32_t m_speed;
    uint64_t m_ticksRun;

    // Prevent copying
    SimLoop(const SimLoop&) = delete;
    SimLoop& operator=(const SimLoop&) = delete;
};

#endif // SIM_LOOP_HPP
