/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SDLFrameScheduler.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <utility>

double SDLFrameScheduler::now() const {
    return static_cast<double>(SDL_GetTicksNS()) / 1'000'000.0;
}

FrameScheduler::FrameHandle SDLFrameScheduler::requestFrame(FrameCallback callback) {
    if (!callback) {
        PLATFORM_WARN("Ignoring frame request without a callback");
        return INVALID_HANDLE;
    }
    if (m_pendingHandle != INVALID_HANDLE) {
        PLATFORM_DEBUG("Replacing pending frame request " + std::to_string(m_pendingHandle));
    }
    m_pending = std::move(callback);
    m_pendingHandle = m_nextHandle++;
    return m_pendingHandle;
}

void SDLFrameScheduler::cancelFrame(FrameHandle handle) {
    if (handle == INVALID_HANDLE || handle != m_pendingHandle) return;
    m_pending = nullptr;
    m_pendingHandle = INVALID_HANDLE;
}

bool SDLFrameScheduler::dispatch() {
    if (m_pendingHandle == INVALID_HANDLE) {
        return false;
    }

    // Take the callback first: it normally requests the next frame
    FrameCallback callback = std::move(m_pending);
    m_pending = nullptr;
    m_pendingHandle = INVALID_HANDLE;
    callback(now());
    return true;
}
