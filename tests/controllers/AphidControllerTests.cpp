/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE AphidControllerTests
#include <boost/test/unit_test.hpp>

#include "controllers/colony/AphidController.hpp"
#include "controllers/common/ColonyTestFixture.hpp"

using Formicary::TileCoord;

namespace {
std::optional<uint8_t> owner(uint8_t id) { return std::optional<uint8_t>(id); }
}

struct AphidFixture : public ColonyTestFixture {
    AphidController m_controller;

    AphidFixture() {
        addColony(TileCoord(5, 10), 0);
        addColony(TileCoord(30, 10), 0);
    }

    Aphid& firstAphid() { return m_agents.aphids().front(); }
};

BOOST_FIXTURE_TEST_SUITE(AphidControllerTestSuite, AphidFixture)

BOOST_AUTO_TEST_CASE(TestResolveOwnerNobodyNearby) {
    BOOST_CHECK(!AphidController::resolveOwner({0, 0, 0}, owner(1)).has_value());
    BOOST_CHECK(!AphidController::resolveOwner({}, std::nullopt).has_value());
}

BOOST_AUTO_TEST_CASE(TestResolveOwnerUniqueLeader) {
    BOOST_CHECK(AphidController::resolveOwner({1, 4, 2}, owner(0)) == owner(1));
    BOOST_CHECK(AphidController::resolveOwner({3, 3, 5}, std::nullopt) == owner(2));
}

BOOST_AUTO_TEST_CASE(TestResolveOwnerTieKeepsCurrent) {
    BOOST_CHECK(AphidController::resolveOwner({2, 3, 3}, owner(0)) == owner(0));
    BOOST_CHECK(!AphidController::resolveOwner({2, 2}, std::nullopt).has_value());
}

BOOST_AUTO_TEST_CASE(TestCrowdClaimsAphid) {
    m_agents.addAphid(TileCoord(15, 9), 0.5f);
    spawn(TileCoord(15, 9), 1, AgentRole::Worker);
    spawn(TileCoord(16, 9), 1, AgentRole::Soldier);
    spawn(TileCoord(14, 9), 0, AgentRole::Worker);

    BOOST_CHECK_EQUAL(m_controller.updateAphids(m_ctx), 1u);
    BOOST_CHECK(firstAphid().ownerColony == owner(1));

    // Same crowd next tick, no change
    BOOST_CHECK_EQUAL(m_controller.updateAphids(m_ctx), 0u);
}

BOOST_AUTO_TEST_CASE(TestOnlyCombatantsInRangeCount) {
    m_agents.addAphid(TileCoord(15, 9), 0.5f);
    spawn(TileCoord(15, 9), 0, AgentRole::Queen);
    spawn(TileCoord(15, 12), 0, AgentRole::Larvae);
    spawn(TileCoord(15, 9), 1, AgentRole::Worker);
    // Manhattan distance 3 is out of reach
    spawn(TileCoord(18, 9), 0, AgentRole::Worker);
    spawn(TileCoord(17, 10), 0, AgentRole::Soldier);

    m_controller.updateAphids(m_ctx);
    BOOST_CHECK(firstAphid().ownerColony == owner(1));
}

BOOST_AUTO_TEST_CASE(TestAbandonedAphidLosesOwner) {
    m_agents.addAphid(TileCoord(15, 9), 0.5f);
    AgentHandle farmer = spawn(TileCoord(15, 9), 0, AgentRole::Worker);
    m_controller.updateAphids(m_ctx);
    BOOST_REQUIRE(firstAphid().ownerColony == owner(0));

    agent(farmer).position = TileCoord(25, 9);
    BOOST_CHECK_EQUAL(m_controller.updateAphids(m_ctx), 1u);
    BOOST_CHECK(!firstAphid().ownerColony.has_value());
}

BOOST_AUTO_TEST_CASE(TestYieldBanksWholeUnits) {
    m_agents.addAphid(TileCoord(15, 9), 0.4f);
    spawn(TileCoord(15, 9), 0, AgentRole::Worker);

    m_controller.updateAphids(m_ctx);
    m_controller.updateAphids(m_ctx);
    BOOST_CHECK_EQUAL(m_colonies.get(0)->foodStored, 0u);

    m_controller.updateAphids(m_ctx);
    BOOST_CHECK_EQUAL(m_colonies.get(0)->foodStored, 1u);
    BOOST_CHECK_CLOSE(m_colonies.get(0)->pendingFood, 0.2f, 0.1f);
    BOOST_CHECK_EQUAL(m_colonies.get(1)->foodStored, 0u);
}

BOOST_AUTO_TEST_SUITE_END()
