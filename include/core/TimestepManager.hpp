/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <cstdint>

/**
 * TimestepManager keeps simulation time separate from display time.
 *
 * Elapsed wall-clock time is fed in once per frame and drained in fixed
 * increments, so every update sees the same delta regardless of frame rate.
 * The time added per frame is capped at maxAccumulator (5 ticks by default);
 * debt beyond the cap is dropped to keep a stalled host from triggering a
 * burst of catch-up updates.
 */
class TimestepManager {
public:
    static constexpr float DEFAULT_TICK_RATE = 1.0f / 60.0f;
    static constexpr int DEFAULT_MAX_ACCUMULATOR_TICKS = 5;

    /**
     * Constructor
     * @param fixedTimestep Fixed timestep for updates in seconds
     * @param maxAccumulatorTicks Per-frame time cap, in ticks
     */
    explicit TimestepManager(float fixedTimestep = DEFAULT_TICK_RATE,
                             int maxAccumulatorTicks = DEFAULT_MAX_ACCUMULATOR_TICKS);

    /**
     * Call this at the start of each frame
     * @param elapsedSeconds wall-clock time since the previous frame
     */
    void startFrame(double elapsedSeconds);

    /**
     * Returns true if an update should be performed with fixed timestep.
     * May return true multiple times per frame for catch-up.
     */
    bool shouldUpdate();

    // True once per frame, until endFrame()
    bool shouldRender() const { return m_shouldRender; }

    void endFrame();

    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Fraction of a tick left in the accumulator after draining, for
     * render interpolation. Clamped to [0, 1].
     */
    double getInterpolationAlpha() const;

    /**
     * Set new fixed timestep for updates; also resets the accumulator cap
     * to maxAccumulatorTicks * timestep
     */
    void setFixedTimestep(float timestep);
    float getFixedTimestep() const { return m_fixedTimestep; }
    double getMaxAccumulator() const { return m_maxAccumulator; }
    double getAccumulator() const { return m_accumulator; }

    // Frames per second, re-measured once per second of wall time
    float getCurrentFPS() const { return m_currentFPS; }
    uint32_t getFrameCount() const { return m_fpsFrameCount; }
    double getLastFrameSeconds() const { return m_lastDeltaSeconds; }

    /**
     * Reset timing state (useful when pausing/unpausing)
     */
    void reset();

private:
    float m_fixedTimestep;
    int m_maxAccumulatorTicks;
    double m_maxAccumulator;
    double m_accumulator{0.0};

    double m_lastDeltaSeconds{0.0};
    double m_fpsElapsed{0.0};
    uint32_t m_fpsFrameCount{0};
    float m_currentFPS{0.0f};

    bool m_shouldRender{false};

    void updateFPS(double elapsedSeconds);
};

#endif // TIMESTEP_MANAGER_HPP
