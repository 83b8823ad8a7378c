/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_LOOP_HPP
#define GAME_LOOP_HPP

#include "core/FrameScheduler.hpp"
#include "core/TimestepManager.hpp"
#include <cstdint>
#include <functional>

/**
 * GameLoop runs fixed-timestep updates and one render per animation frame.
 *
 * Frames come from an injected FrameScheduler, so the loop never blocks:
 * each frame callback measures the elapsed time, drains the accumulator with
 * update(tickRate) calls, renders once and requests the next frame.
 * Exceptions escaping a handler are logged and the loop keeps running.
 */
class GameLoop {
public:
    using UpdateHandler = std::function<void(float deltaTime)>;
    using RenderHandler = std::function<void()>;

    /**
     * Constructor
     * @param scheduler Frame source; must outlive the loop
     * @param tickRate Fixed timestep for updates in seconds
     * @param maxAccumulatorTicks Per-frame catch-up cap, in ticks
     */
    explicit GameLoop(FrameScheduler& scheduler,
                      float tickRate = TimestepManager::DEFAULT_TICK_RATE,
                      int maxAccumulatorTicks = TimestepManager::DEFAULT_MAX_ACCUMULATOR_TICKS);

    /**
     * Destructor - cancels any pending frame request
     */
    ~GameLoop();

    void setUpdateHandler(UpdateHandler handler);
    void setRenderHandler(RenderHandler handler);
    void setCallbacks(UpdateHandler update, RenderHandler render);

    /**
     * Start the loop. Runs the first frame immediately, then keeps one frame
     * request pending with the scheduler.
     * @return false if the loop was already running (nothing changes)
     */
    bool start();

    /**
     * Stop the loop and cancel the pending frame request. Safe to call from
     * inside a handler; the current frame completes.
     */
    void stop();

    bool isRunning() const { return m_running; }

    float getCurrentFPS() const { return m_timestepManager.getCurrentFPS(); }
    uint32_t getFrameCount() const { return m_timestepManager.getFrameCount(); }
    uint64_t getUpdateCount() const { return m_updateCount; }

    float getTickRate() const { return m_timestepManager.getFixedTimestep(); }

    // Also resets the accumulator cap
    void setTickRate(float tickRate);
    double getMaxAccumulator() const { return m_timestepManager.getMaxAccumulator(); }

    // Unclamped wall time of the last frame, in seconds
    double getVariableDeltaTime() const { return m_timestepManager.getLastFrameSeconds(); }

    // Restart frame timing from now and drop accumulated time
    void resetFrameTiming();

    TimestepManager& getTimestepManager() { return m_timestepManager; }

private:
    FrameScheduler& m_scheduler;
    TimestepManager m_timestepManager;

    UpdateHandler m_updateHandler;
    RenderHandler m_renderHandler;

    bool m_running{false};
    double m_lastFrameTime{0.0};
    uint64_t m_updateCount{0};
    FrameScheduler::FrameHandle m_pendingFrame{FrameScheduler::INVALID_HANDLE};

    void runFrame(double timestampMs);
    void requestNextFrame();
    void processUpdates();
    void processRender();

    void invokeUpdateHandler(float deltaTime);
    void invokeRenderHandler();

    // Prevent copying
    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
};

#endif // GAME_LOOP_HPP
