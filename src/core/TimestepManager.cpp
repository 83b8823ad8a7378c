/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <algorithm>
#include <cmath>

TimestepManager::TimestepManager(float fixedTimestep, int maxAccumulatorTicks)
    : m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : DEFAULT_TICK_RATE)
    , m_maxAccumulatorTicks(std::max(1, maxAccumulatorTicks))
    , m_maxAccumulator(static_cast<double>(m_fixedTimestep) * m_maxAccumulatorTicks)
{
}

void TimestepManager::startFrame(double elapsedSeconds) {
    // Host clocks may step backwards (suspend, clock adjustment)
    elapsedSeconds = std::max(0.0, elapsedSeconds);
    m_lastDeltaSeconds = elapsedSeconds;

    m_accumulator += std::min(elapsedSeconds, m_maxAccumulator);
    m_shouldRender = true;

    updateFPS(elapsedSeconds);
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() {
    m_shouldRender = false;
}

double TimestepManager::getInterpolationAlpha() const {
    double alpha = m_accumulator / m_fixedTimestep;
    return std::clamp(alpha, 0.0, 1.0);
}

void TimestepManager::setFixedTimestep(float timestep) {
    if (timestep > 0.0f) {
        m_fixedTimestep = timestep;
        m_maxAccumulator = static_cast<double>(timestep) * m_maxAccumulatorTicks;
    }
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_lastDeltaSeconds = 0.0;
    m_fpsElapsed = 0.0;
    m_fpsFrameCount = 0;
    m_currentFPS = 0.0f;
    m_shouldRender = false;
}

void TimestepManager::updateFPS(double elapsedSeconds) {
    ++m_fpsFrameCount;
    m_fpsElapsed += elapsedSeconds;

    if (m_fpsElapsed >= 1.0) {
        m_currentFPS = static_cast<float>(std::round(m_fpsFrameCount / m_fpsElapsed));
        m_fpsFrameCount = 0;
        m_fpsElapsed = 0.0;
    }
}
