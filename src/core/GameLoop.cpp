/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameLoop.hpp"
#include "core/Logger.hpp"
#include <exception>
#include <utility>
#include <string>

GameLoop::GameLoop(FrameScheduler& scheduler, float tickRate, int maxAccumulatorTicks)
    : m_scheduler(scheduler)
    , m_timestepManager(tickRate, maxAccumulatorTicks)
{
}

GameLoop::~GameLoop() {
    stop();
}

void GameLoop::setUpdateHandler(UpdateHandler handler) {
    m_updateHandler = std::move(handler);
}

void GameLoop::setRenderHandler(RenderHandler handler) {
    m_renderHandler = std::move(handler);
}

void GameLoop::setCallbacks(UpdateHandler update, RenderHandler render) {
    m_updateHandler = std::move(update);
    m_renderHandler = std::move(render);
}

bool GameLoop::start() {
    if (m_running) {
        GAMELOOP_WARN("GameLoop already running");
        return false;
    }

    m_running = true;
    m_timestepManager.reset();

    const double now = m_scheduler.now();
    m_lastFrameTime = now;
    GAMELOOP_INFO("GameLoop started at " + std::to_string(1.0f / getTickRate()) + " Hz");

    runFrame(now);
    return true;
}

void GameLoop::stop() {
    if (!m_running) return;

    m_running = false;
    if (m_pendingFrame != FrameScheduler::INVALID_HANDLE) {
        m_scheduler.cancelFrame(m_pendingFrame);
        m_pendingFrame = FrameScheduler::INVALID_HANDLE;
    }
    GAMELOOP_INFO("GameLoop stopped");
}

void GameLoop::setTickRate(float tickRate) {
    if (tickRate <= 0.0f) {
        GAMELOOP_WARN("Ignoring non-positive tick rate " + std::to_string(tickRate));
        return;
    }
    m_timestepManager.setFixedTimestep(tickRate);
}

void GameLoop::resetFrameTiming() {
    m_lastFrameTime = m_scheduler.now();
    m_timestepManager.reset();
}

void GameLoop::runFrame(double timestampMs) {
    m_pendingFrame = FrameScheduler::INVALID_HANDLE;
    if (!m_running) return;

    const double elapsedSeconds = (timestampMs - m_lastFrameTime) / 1000.0;
    m_lastFrameTime = timestampMs;

    m_timestepManager.startFrame(elapsedSeconds);
    processUpdates();
    processRender();
    m_timestepManager.endFrame();

    // A handler may have stopped the loop
    if (m_running) {
        requestNextFrame();
    }
}

void GameLoop::requestNextFrame() {
    m_pendingFrame = m_scheduler.requestFrame([this](double timestampMs) { runFrame(timestampMs); });
    if (m_pendingFrame == FrameScheduler::INVALID_HANDLE) {
        GAMELOOP_ERROR("Frame scheduler refused the next frame request, stopping");
        m_running = false;
    }
}

void GameLoop::processUpdates() {
    while (m_timestepManager.shouldUpdate()) {
        invokeUpdateHandler(m_timestepManager.getUpdateDeltaTime());
        ++m_updateCount;
    }
}

void GameLoop::processRender() {
    if (m_timestepManager.shouldRender()) {
        invokeRenderHandler();
    }
}

void GameLoop::invokeUpdateHandler(float deltaTime) {
    if (m_updateHandler) {
        try {
            m_updateHandler(deltaTime);
        } catch (const std::exception& e) {
            GAMELOOP_ERROR("Exception in update handler: " + std::string(e.what()));
        }
    }
}

void GameLoop::invokeRenderHandler() {
    if (m_renderHandler) {
        try {
            m_renderHandler();
        } catch (const std::exception& e) {
            GAMELOOP_ERROR("Exception in render handler: " + std::string(e.what()));
        }
    }
}
