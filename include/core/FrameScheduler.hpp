/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FRAME_SCHEDULER_HPP
#define FRAME_SCHEDULER_HPP

#include <cstdint>
#include <functional>

/**
 * Host-side animation frame source driving the GameLoop.
 *
 * A request schedules exactly one callback on the next frame; the callback
 * receives the frame timestamp in milliseconds on the same clock as now().
 * Cancelling a handle that already fired (or was never issued) is a no-op.
 */
class FrameScheduler {
public:
    using FrameHandle = uint64_t;
    using FrameCallback = std::function<void(double timestampMs)>;

    static constexpr FrameHandle INVALID_HANDLE = 0;

    virtual ~FrameScheduler() = default;

    virtual double now() const = 0;
    virtual FrameHandle requestFrame(FrameCallback callback) = 0;
    virtual void cancelFrame(FrameHandle handle) = 0;
};

#endif // FRAME_SCHEDULER_HPP
