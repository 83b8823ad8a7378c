/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE GameLoopTests
#include <boost/test/unit_test.hpp>

#include "core/GameLoop.hpp"
#include "core/TimestepManager.hpp"
#include "mocks/MockFrameScheduler.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {
// 64 Hz keeps every tick exactly representable
constexpr float TICK = 1.0f / 64.0f;
constexpr double TICK_MS = 15.625;
}

struct GameLoopFixture {
    MockFrameScheduler scheduler;
    GameLoop loop{scheduler, TICK, 5};
    std::vector<float> updates;
    int renders{0};

    GameLoopFixture() {
        loop.setCallbacks([this](float dt) { updates.push_back(dt); },
                          [this]() { ++renders; });
    }
};

BOOST_FIXTURE_TEST_SUITE(GameLoopFrameTests, GameLoopFixture)

BOOST_AUTO_TEST_CASE(TestStartRunsFirstFrameImmediately) {
    BOOST_CHECK(loop.start());

    BOOST_CHECK(loop.isRunning());
    BOOST_CHECK(updates.empty());
    BOOST_CHECK_EQUAL(renders, 1);
    BOOST_CHECK_EQUAL(scheduler.requestCount, 1);
    BOOST_CHECK(scheduler.hasPending());
}

BOOST_AUTO_TEST_CASE(TestStartTwiceIsRejected) {
    BOOST_CHECK(loop.start());
    BOOST_CHECK(!loop.start());
    BOOST_CHECK_EQUAL(renders, 1);
}

BOOST_AUTO_TEST_CASE(TestFixedStepUpdates) {
    loop.start();

    scheduler.advance(TICK_MS);
    BOOST_REQUIRE_EQUAL(updates.size(), 1u);
    BOOST_CHECK_EQUAL(updates[0], TICK);

    scheduler.advance(TICK_MS * 2.0);
    BOOST_CHECK_EQUAL(updates.size(), 3u);
    BOOST_CHECK_EQUAL(renders, 3);
    BOOST_CHECK_EQUAL(loop.getUpdateCount(), 3u);
}

BOOST_AUTO_TEST_CASE(TestShortFramesAccumulate) {
    loop.start();

    scheduler.advance(TICK_MS / 2.0);
    BOOST_CHECK(updates.empty());
    BOOST_CHECK_EQUAL(renders, 2);

    scheduler.advance(TICK_MS / 2.0);
    BOOST_CHECK_EQUAL(updates.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestLongStallIsCapped) {
    loop.start();

    scheduler.advance(1000.0);

    BOOST_CHECK_EQUAL(updates.size(), 5u);
    BOOST_CHECK_EQUAL(renders, 2);
    BOOST_CHECK_CLOSE(loop.getVariableDeltaTime(), 1.0, 0.001);
    BOOST_CHECK_EQUAL(loop.getTimestepManager().getAccumulator(), 0.0);
}

BOOST_AUTO_TEST_CASE(TestUpdateCountMatchesElapsedTime) {
    // Binary fractions of a second so the accumulator stays exact
    const std::vector<double> frameMs{7.8125, 23.4375, 15.625, 3.90625, 46.875,
                                      31.25, 11.71875, 78.125, 1.953125, 19.53125};
    loop.start();

    double totalMs = 0.0;
    for (double ms : frameMs) {
        scheduler.advance(ms);
        totalMs += ms;
        BOOST_CHECK_EQUAL(updates.size(), static_cast<size_t>(std::floor(totalMs / TICK_MS)));
    }

    BOOST_CHECK_EQUAL(updates.size(), 15u);
    BOOST_CHECK_EQUAL(renders, static_cast<int>(frameMs.size()) + 1);
    for (float dt : updates) {
        BOOST_CHECK_EQUAL(dt, TICK);
    }
    // Leftover debt is below one tick
    BOOST_CHECK_CLOSE(loop.getTimestepManager().getAccumulator(), 0.375 * TICK, 0.001);
}

BOOST_AUTO_TEST_CASE(TestStallsAreClampedPerFrame) {
    const double capMs = TICK_MS * 5.0;
    const std::vector<double> frameMs{7.8125, 250.0, 23.4375, 1000.0, 3.90625, 46.875};
    loop.start();

    double clampedMs = 0.0;
    for (double ms : frameMs) {
        const size_t before = updates.size();
        scheduler.advance(ms);
        clampedMs += std::min(ms, capMs);

        BOOST_CHECK_LE(updates.size() - before, 5u);
        BOOST_CHECK_EQUAL(updates.size(), static_cast<size_t>(std::floor(clampedMs / TICK_MS)));
    }

    BOOST_CHECK_EQUAL(updates.size(), 15u);
}

BOOST_AUTO_TEST_CASE(TestStopCancelsPendingFrame) {
    loop.start();
    loop.stop();

    BOOST_CHECK(!loop.isRunning());
    BOOST_CHECK_EQUAL(scheduler.cancelCount, 1);
    BOOST_CHECK(!scheduler.hasPending());
    BOOST_CHECK(!scheduler.advance(TICK_MS));
    BOOST_CHECK_EQUAL(renders, 1);

    // Stopping again does nothing
    loop.stop();
    BOOST_CHECK_EQUAL(scheduler.cancelCount, 1);
}

BOOST_AUTO_TEST_CASE(TestStopFromHandlerFinishesFrame) {
    loop.setUpdateHandler([this](float dt) {
        updates.push_back(dt);
        loop.stop();
    });
    loop.start();

    scheduler.advance(TICK_MS * 2.0);

    // Both ticks of the frame still run, then no further frame is requested
    BOOST_CHECK_EQUAL(updates.size(), 2u);
    BOOST_CHECK_EQUAL(renders, 2);
    BOOST_CHECK(!loop.isRunning());
    BOOST_CHECK(!scheduler.hasPending());
    BOOST_CHECK_EQUAL(scheduler.requestCount, 1);
}

BOOST_AUTO_TEST_CASE(TestRestartAfterStop) {
    loop.start();
    scheduler.advance(TICK_MS);
    loop.stop();

    BOOST_CHECK(loop.start());
    BOOST_CHECK(scheduler.hasPending());
    scheduler.advance(TICK_MS);
    BOOST_CHECK_EQUAL(updates.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestHandlerExceptionsAreContained) {
    int failures = 0;
    loop.setCallbacks([&failures](float) {
                          ++failures;
                          throw std::runtime_error("update failed");
                      },
                      []() { throw std::runtime_error("render failed"); });
    loop.start();

    BOOST_CHECK_NO_THROW(scheduler.advance(TICK_MS));

    BOOST_CHECK_EQUAL(failures, 1);
    BOOST_CHECK(loop.isRunning());
    BOOST_CHECK(scheduler.hasPending());
}

BOOST_AUTO_TEST_CASE(TestRefusedFrameRequestStopsLoop) {
    scheduler.failRequests = true;

    BOOST_CHECK(loop.start());

    BOOST_CHECK(!loop.isRunning());
    BOOST_CHECK_EQUAL(renders, 1);
    BOOST_CHECK(!scheduler.hasPending());
}

BOOST_AUTO_TEST_CASE(TestMissingHandlersAreSkipped) {
    loop.setCallbacks(nullptr, nullptr);
    loop.start();

    BOOST_CHECK_NO_THROW(scheduler.advance(TICK_MS));
    BOOST_CHECK_EQUAL(loop.getUpdateCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestTickRateChange) {
    loop.setTickRate(0.0f);
    BOOST_CHECK_EQUAL(loop.getTickRate(), TICK);

    loop.setTickRate(TICK * 2.0f);
    BOOST_CHECK_EQUAL(loop.getTickRate(), TICK * 2.0f);
    BOOST_CHECK_CLOSE(loop.getMaxAccumulator(), TICK * 2.0 * 5.0, 0.001);

    loop.start();
    scheduler.advance(TICK_MS * 2.0);
    BOOST_REQUIRE_EQUAL(updates.size(), 1u);
    BOOST_CHECK_EQUAL(updates[0], TICK * 2.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(GameLoopLifetimeTests)

BOOST_AUTO_TEST_CASE(TestDestructorCancelsFrame) {
    MockFrameScheduler scheduler;
    {
        GameLoop loop(scheduler, TICK, 5);
        loop.start();
        BOOST_REQUIRE(scheduler.hasPending());
    }
    BOOST_CHECK_EQUAL(scheduler.cancelCount, 1);
    BOOST_CHECK(!scheduler.hasPending());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TimestepManagerTests)

BOOST_AUTO_TEST_CASE(TestInvalidConstructionFallsBack) {
    TimestepManager timestep(-1.0f, 0);

    BOOST_CHECK_EQUAL(timestep.getFixedTimestep(), TimestepManager::DEFAULT_TICK_RATE);
    BOOST_CHECK_CLOSE(timestep.getMaxAccumulator(), TimestepManager::DEFAULT_TICK_RATE, 0.001);
}

BOOST_AUTO_TEST_CASE(TestBackwardClockIsIgnored) {
    TimestepManager timestep(TICK, 5);

    timestep.startFrame(-0.5);

    BOOST_CHECK_EQUAL(timestep.getAccumulator(), 0.0);
    BOOST_CHECK(!timestep.shouldUpdate());
    BOOST_CHECK(timestep.shouldRender());
    timestep.endFrame();
    BOOST_CHECK(!timestep.shouldRender());
}

BOOST_AUTO_TEST_CASE(TestInterpolationAlpha) {
    TimestepManager timestep(TICK, 5);

    timestep.startFrame(TICK * 1.5);
    while (timestep.shouldUpdate()) {}

    BOOST_CHECK_CLOSE(timestep.getInterpolationAlpha(), 0.5, 0.001);
}

BOOST_AUTO_TEST_CASE(TestFPSMeasuredPerSecond) {
    TimestepManager timestep(TICK, 5);

    for (int i = 0; i < 63; ++i) {
        timestep.startFrame(TICK_MS / 1000.0);
        timestep.endFrame();
    }
    BOOST_CHECK_EQUAL(timestep.getCurrentFPS(), 0.0f);
    BOOST_CHECK_EQUAL(timestep.getFrameCount(), 63u);

    timestep.startFrame(TICK_MS / 1000.0);
    BOOST_CHECK_EQUAL(timestep.getCurrentFPS(), 64.0f);
    BOOST_CHECK_EQUAL(timestep.getFrameCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestResetDropsDebt) {
    TimestepManager timestep(TICK, 5);
    timestep.startFrame(TICK * 3.0);

    timestep.reset();

    BOOST_CHECK_EQUAL(timestep.getAccumulator(), 0.0);
    BOOST_CHECK(!timestep.shouldUpdate());
}

BOOST_AUTO_TEST_SUITE_END()
