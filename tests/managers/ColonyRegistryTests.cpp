/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ColonyRegistryTests
#include <boost/test/unit_test.hpp>

#include "managers/ColonyRegistry.hpp"

using Formicary::TileCoord;

BOOST_AUTO_TEST_SUITE(ColonyRegistryTestSuite)

BOOST_AUTO_TEST_CASE(TestIdsFollowInsertion) {
    ColonyRegistry registry(3);
    BOOST_CHECK_EQUAL(registry.addColony(TileCoord(10, 9), 100), 0);
    BOOST_CHECK_EQUAL(registry.addColony(TileCoord(50, 9), 80), 1);
    BOOST_CHECK_EQUAL(registry.size(), 2u);
    BOOST_CHECK_EQUAL(registry.get(1)->foodStored, 80u);
    BOOST_CHECK(registry.get(1)->queenAlive);
}

BOOST_AUTO_TEST_CASE(TestCapacityRejects) {
    ColonyRegistry registry(1);
    registry.addColony(TileCoord(0, 0), 0);
    BOOST_CHECK_EQUAL(registry.addColony(TileCoord(5, 0), 0), registry.capacity());
    BOOST_CHECK_EQUAL(registry.size(), 1u);
    BOOST_CHECK(registry.get(1) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestConsumeSaturates) {
    ColonyRegistry registry;
    uint8_t id = registry.addColony(TileCoord(0, 0), 5);
    BOOST_CHECK_EQUAL(registry.consumeFood(id, 3), 3u);
    BOOST_CHECK_EQUAL(registry.consumeFood(id, 10), 2u);
    BOOST_CHECK_EQUAL(registry.get(id)->foodStored, 0u);
    BOOST_CHECK_EQUAL(registry.consumeFood(42, 1), 0u);
}

BOOST_AUTO_TEST_CASE(TestFractionalCreditBanksWholeUnits) {
    ColonyRegistry registry;
    uint8_t id = registry.addColony(TileCoord(0, 0), 0);
    for (int i = 0; i < 9; ++i) {
        registry.creditFractionalFood(id, 0.25f);
    }
    BOOST_CHECK_EQUAL(registry.get(id)->foodStored, 2u);
    BOOST_CHECK_CLOSE(registry.get(id)->pendingFood, 0.25f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestQueenDeathKeepsRecord) {
    ColonyRegistry registry;
    uint8_t id = registry.addColony(TileCoord(0, 0), 10);
    registry.markQueenDead(id);
    BOOST_REQUIRE(registry.get(id) != nullptr);
    BOOST_CHECK(!registry.get(id)->queenAlive);
    BOOST_CHECK_EQUAL(registry.get(id)->foodStored, 10u);
}

BOOST_AUTO_TEST_SUITE_END()
