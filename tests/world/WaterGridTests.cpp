/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE WaterGridTests
#include <boost/test/unit_test.hpp>

#include "mocks/ScriptedRandom.hpp"
#include "world/TileGrid.hpp"
#include "world/WaterGrid.hpp"

using namespace Formicary;

struct WaterGridFixture {
    WaterSettings settings;
    TileGrid terrain;
    WaterGrid water;
    ScriptedRandom rng;

    // 8x8 box: tunnel interior, soil walls on every side
    WaterGridFixture() : settings(), terrain(8, 8, TileKind::Soil), water(8, 8, settings) {
        terrain.fillRect(1, 1, 6, 6, TileKind::Tunnel);
    }

    void step(int ticks) {
        for (int i = 0; i < ticks; ++i) {
            water.calculatePressure(terrain);
            water.flow(terrain);
        }
    }
};

BOOST_FIXTURE_TEST_SUITE(WaterGridTestSuite, WaterGridFixture)

BOOST_AUTO_TEST_CASE(TestAddWaterSaturates) {
    water.addWater(3, 3, 5);
    water.addWater(3, 3, 5);
    BOOST_CHECK_EQUAL(water.depth(3, 3), settings.maxDepth);

    water.addWater(-1, 3, 2);
    BOOST_CHECK_EQUAL(water.depth(-1, 3), 0);
}

BOOST_AUTO_TEST_CASE(TestTransferRejectsOverflow) {
    water.addWater(2, 2, 3);
    water.addWater(2, 3, 6);

    BOOST_CHECK(!water.transfer(2, 2, 2, 3, 2, FlowDirection::Down));
    BOOST_CHECK(!water.transfer(2, 2, 2, 3, 4, FlowDirection::Down));
    BOOST_CHECK(water.transfer(2, 2, 2, 3, 1, FlowDirection::Down));
    BOOST_CHECK_EQUAL(water.depth(2, 2), 2);
    BOOST_CHECK_EQUAL(water.depth(2, 3), 7);
    BOOST_CHECK_EQUAL(water.cell(2, 2).flowDirection, FlowDirection::Down);
}

BOOST_AUTO_TEST_CASE(TestPressureCountsColumnAbove) {
    water.addWater(3, 2, 2);
    water.addWater(3, 3, 3);
    water.calculatePressure(terrain);

    BOOST_CHECK_EQUAL(water.cell(3, 2).pressure, 2);
    BOOST_CHECK_EQUAL(water.cell(3, 3).pressure, 5);
    BOOST_CHECK_EQUAL(water.cell(3, 4).pressure, 0);
}

BOOST_AUTO_TEST_CASE(TestWaterFallsToFloor) {
    water.addWater(3, 1, 1);
    step(10);
    BOOST_CHECK_EQUAL(water.depth(3, 1), 0);

    uint32_t onFloor = 0;
    for (int32_t x = 1; x <= 6; ++x) {
        onFloor += water.depth(x, 6);
    }
    BOOST_CHECK_EQUAL(onFloor, 1u);
}

BOOST_AUTO_TEST_CASE(TestFlowConservesDepth) {
    water.addWater(1, 1, 7);
    water.addWater(4, 2, 5);
    water.addWater(6, 6, 3);
    uint64_t before = water.totalDepth();

    step(40);
    BOOST_CHECK_EQUAL(water.totalDepth(), before);

    for (int32_t y = 0; y < 8; ++y) {
        for (int32_t x = 0; x < 8; ++x) {
            BOOST_CHECK_LE(water.depth(x, y), settings.maxDepth);
            if (!terrain.isPassable(x, y)) {
                BOOST_CHECK_EQUAL(water.depth(x, y), 0);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(TestEvaporationNeedsStagnantExposure) {
    settings.stagnantEvaporationTicks = 2;
    WaterGrid shallow(8, 8, settings);
    shallow.addWater(3, 6, 1);  // exposed, open tunnel above
    shallow.addWater(4, 6, 3);  // too deep to evaporate

    for (int i = 0; i < 3; ++i) {
        shallow.evaporate(terrain);
    }
    BOOST_CHECK_EQUAL(shallow.depth(3, 6), 0);
    BOOST_CHECK_EQUAL(shallow.depth(4, 6), 3);
}

BOOST_AUTO_TEST_CASE(TestWadeable) {
    water.addWater(2, 2, settings.passableThreshold);
    water.addWater(3, 2, static_cast<uint8_t>(settings.passableThreshold - 1));
    BOOST_CHECK(!water.isWadeable(2, 2));
    BOOST_CHECK(water.isWadeable(3, 2));
}

BOOST_AUTO_TEST_CASE(TestRainFillsAboveFirstSolidTile) {
    TileGrid layered = TileGrid::layered(8, 8, 3, 6, 7);
    water.startRain(RainEvent{2, 2, 1.0f});
    rng.setFallbackFloat(0.0f);

    BOOST_CHECK(water.updateRain(layered, rng));
    // Surface row 3 is passable, soil starts at row 4
    BOOST_CHECK_EQUAL(water.depth(0, 3), 2);
    BOOST_CHECK_EQUAL(water.depth(7, 3), 2);
    BOOST_CHECK_EQUAL(water.totalDepth(), 16u);

    // Last tick of the event still rains, then it ends
    BOOST_CHECK(!water.updateRain(layered, rng));
    BOOST_CHECK(!water.activeRain().has_value());
    BOOST_CHECK_EQUAL(water.depth(0, 3), 4);
}

BOOST_AUTO_TEST_CASE(TestRainStartsOnWinningRoll) {
    TileGrid layered = TileGrid::layered(8, 8, 3, 6, 7);
    rng.queueInts({1});
    BOOST_CHECK(!water.updateRain(layered, rng));
    BOOST_CHECK(!water.activeRain().has_value());

    rng.queueInts({0, 2, 300});
    rng.queueFloat(0.5f);
    BOOST_CHECK(water.updateRain(layered, rng));
    BOOST_REQUIRE(water.activeRain().has_value());
    BOOST_CHECK_EQUAL(water.activeRain()->intensity, 2);
    BOOST_CHECK_EQUAL(water.activeRain()->remainingTicks, 299u);
}

BOOST_AUTO_TEST_SUITE_END()
