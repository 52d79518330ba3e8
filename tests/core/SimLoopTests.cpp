/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SimLoopTests
#include <boost/test/unit_test.hpp>

#include "core/SimLoop.hpp"
#include <stdexcept>
#include <vector>

BOOST_AUTO_TEST_SUITE(SimLoopTestSuite)

BOOST_AUTO_TEST_CASE(TestRunsExactTickCount) {
    SimLoop loop(0.0f, 3);
    int ticks = 0;
    loop.setTickHandler([&]() { ++ticks; });

    BOOST_CHECK(loop.run(10));
    BOOST_CHECK_EQUAL(ticks, 10);
    BOOST_CHECK_EQUAL(loop.getTicksRun(), 10u);
    BOOST_CHECK(!loop.isRunning());
}

BOOST_AUTO_TEST_CASE(TestFrameHandlerSeesWholeFrames) {
    SimLoop loop(0.0f, 4);
    std::vector<uint64_t> frames;
    loop.setTickHandler([]() {});
    loop.setFrameHandler([&](uint64_t ticksRun) { frames.push_back(ticksRun); });

    BOOST_CHECK(loop.run(10));
    BOOST_REQUIRE_EQUAL(frames.size(), 3u);
    BOOST_CHECK_EQUAL(frames[0], 4u);
    BOOST_CHECK_EQUAL(frames[1], 8u);
    BOOST_CHECK_EQUAL(frames[2], 10u);
}

BOOST_AUTO_TEST_CASE(TestStopFromTickHandler) {
    SimLoop loop(0.0f, 1);
    int ticks = 0;
    loop.setTickHandler([&]() {
        if (++ticks == 5) {
            loop.stop();
        }
    });

    BOOST_CHECK(loop.run(0));
    BOOST_CHECK_EQUAL(ticks, 5);
}

BOOST_AUTO_TEST_CASE(TestPausedFramesRunNoTicks) {
    SimLoop loop(0.0f, 2);
    int ticks = 0;
    int frames = 0;
    loop.setTickHandler([&]() { ++ticks; });
    loop.setFrameHandler([&](uint64_t) {
        if (++frames == 3) {
            loop.stop();
        }
    });
    loop.setPaused(true);

    BOOST_CHECK(loop.run(0));
    BOOST_CHECK_EQUAL(ticks, 0);
    BOOST_CHECK_EQUAL(frames, 3);
}

BOOST_AUTO_TEST_CASE(TestThrowingHandlerEndsRun) {
    SimLoop loop(0.0f, 1);
    loop.setTickHandler([]() { throw std::runtime_error("boom"); });
    BOOST_CHECK(!loop.run(5));
    BOOST_CHECK(!loop.isRunning());
}

BOOST_AUTO_TEST_CASE(TestRunWithoutHandlerFails) {
    SimLoop loop;
    BOOST_CHECK(!loop.run(1));
}

BOOST_AUTO_TEST_CASE(TestSpeedClampedToOne) {
    SimLoop loop(0.0f, 0);
    BOOST_CHECK_EQUAL(loop.getSpeed(), 1u);
    loop.setSpeed(0);
    BOOST_CHECK_EQUAL(loop.getSpeed(), 1u);
    loop.setSpeed(8);
    BOOST_CHECK_EQUAL(loop.getSpeed(), 8u);
}

BOOST_AUTO_TEST_SUITE_END()
