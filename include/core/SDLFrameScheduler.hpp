/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SDL_FRAME_SCHEDULER_HPP
#define SDL_FRAME_SCHEDULER_HPP

#include "core/FrameScheduler.hpp"

/**
 * FrameScheduler on SDL's nanosecond tick counter. The host loop calls
 * dispatch() once per presented frame; at most one callback is pending.
 */
class SDLFrameScheduler : public FrameScheduler {
public:
    double now() const override;
    FrameHandle requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameHandle handle) override;

    // Runs the pending callback, if any. Returns false when nothing was due.
    bool dispatch();

    bool hasPendingFrame() const { return m_pendingHandle != INVALID_HANDLE; }

private:
    FrameCallback m_pending;
    FrameHandle m_pendingHandle{INVALID_HANDLE};
    FrameHandle m_nextHandle{1};
};

#endif // SDL_FRAME_SCHEDULER_HPP
