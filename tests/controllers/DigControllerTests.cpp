/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE DigControllerTests
#include <boost/test/unit_test.hpp>

#include "controllers/colony/DigController.hpp"
#include "controllers/common/ColonyTestFixture.hpp"

using Formicary::PheromoneType;
using Formicary::TileCoord;
using Formicary::TileKind;

struct DigFixture : public ColonyTestFixture {
    DigController m_controller;
    TileCoord m_surface{10, SURFACE_ROW};

    DigFixture() { addColony(m_surface); }
};

BOOST_FIXTURE_TEST_SUITE(DigControllerTestSuite, DigFixture)

BOOST_AUTO_TEST_CASE(TestTerrainQueries) {
    BOOST_CHECK(DigController::canDig(m_terrain, m_surface));
    BOOST_CHECK(DigController::onGround(m_terrain, m_surface));
    BOOST_CHECK(!DigController::canDig(m_terrain, TileCoord(10, 5)));
    BOOST_CHECK(!DigController::onGround(m_terrain, TileCoord(10, 5)));

    // Bedrock below cannot be dug
    digTunnel(10, BEDROCK_ROW - 1, 10, BEDROCK_ROW - 1);
    m_terrain.set(9, BEDROCK_ROW - 1, TileKind::Tunnel);
    m_terrain.set(11, BEDROCK_ROW - 1, TileKind::Tunnel);
    BOOST_CHECK(!DigController::canDig(m_terrain, TileCoord(10, BEDROCK_ROW - 1)));
}

BOOST_AUTO_TEST_CASE(TestWandererStartsDigging) {
    AgentHandle worker = spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Wandering);

    // Default roll fails the start chance
    BOOST_CHECK_EQUAL(m_controller.updateWorkerStates(m_ctx), 0u);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Wandering);

    m_rng.queueInt(0);
    BOOST_CHECK_EQUAL(m_controller.updateWorkerStates(m_ctx), 1u);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Digging);
}

BOOST_AUTO_TEST_CASE(TestWandererPicksUpTrail) {
    TileCoord sky(10, 5);
    AgentHandle worker = spawn(sky, 0, AgentRole::Worker, BehaviorState::Wandering);
    m_pheromones.deposit(sky.x, sky.y, 0, PheromoneType::Food, 0.5f);

    m_controller.updateWorkerStates(m_ctx);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Following);
    BOOST_CHECK_EQUAL(m_rng.intDraws(), 0u);

    m_pheromones.clear();
    m_controller.updateWorkerStates(m_ctx);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Wandering);
}

BOOST_AUTO_TEST_CASE(TestDeepDiggerGivesUpSooner) {
    digTunnel(10, 14, 10, 14);
    AgentHandle deep = spawn(TileCoord(10, 14), 0, AgentRole::Worker, BehaviorState::Digging);
    AgentHandle shallow = spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Digging);

    m_rng.queueInts({10, 10});
    m_controller.updateWorkerStates(m_ctx);
    BOOST_CHECK_EQUAL(agent(deep).state(), BehaviorState::Returning);
    BOOST_CHECK_EQUAL(agent(shallow).state(), BehaviorState::Digging);
}

BOOST_AUTO_TEST_CASE(TestNothingLeftToDigReturns) {
    digTunnel(5, 12, 20, 16);
    AgentHandle worker = spawn(TileCoord(10, 13), 0, AgentRole::Worker, BehaviorState::Digging);

    m_controller.updateWorkerStates(m_ctx);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Returning);
    BOOST_CHECK_EQUAL(m_rng.intDraws(), 0u);
}

BOOST_AUTO_TEST_CASE(TestReturningWorkerSurfaces) {
    AgentHandle worker = spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Returning);
    m_controller.updateWorkerStates(m_ctx);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Wandering);
}

BOOST_AUTO_TEST_CASE(TestReturningWorkerDistracted) {
    digTunnel(5, 12, 20, 16);
    AgentHandle floor = spawn(TileCoord(10, 16), 0, AgentRole::Worker, BehaviorState::Returning);
    AgentHandle midair = spawn(TileCoord(10, 13), 0, AgentRole::Worker, BehaviorState::Returning);

    m_rng.queueInt(0);
    m_controller.updateWorkerStates(m_ctx);
    BOOST_CHECK_EQUAL(agent(floor).state(), BehaviorState::Digging);
    BOOST_CHECK_EQUAL(agent(midair).state(), BehaviorState::Returning);
}

BOOST_AUTO_TEST_CASE(TestIdleWorkerWakes) {
    AgentHandle worker = spawn(TileCoord(10, 5), 0, AgentRole::Worker, BehaviorState::Idle);
    m_controller.updateWorkerStates(m_ctx);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Idle);

    m_rng.queueInt(0);
    m_controller.updateWorkerStates(m_ctx);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Wandering);
}

BOOST_AUTO_TEST_CASE(TestOtherRolesIgnored) {
    AgentHandle soldier = spawn(m_surface, 0, AgentRole::Soldier, BehaviorState::Wandering);
    m_rng.setFallbackInt(0);
    BOOST_CHECK_EQUAL(m_controller.updateWorkerStates(m_ctx), 0u);
    BOOST_CHECK_EQUAL(agent(soldier).state(), BehaviorState::Wandering);
}

BOOST_AUTO_TEST_CASE(TestDigOpensTileBelow) {
    spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Digging);

    // Dig roll, then one reinforcement roll per soil wall
    m_rng.queueInts({0, 0, 255});
    BOOST_CHECK_EQUAL(m_controller.applyDigging(m_ctx), 1u);

    BOOST_CHECK_EQUAL(m_terrain.get(10, 11), TileKind::Tunnel);
    BOOST_CHECK_EQUAL(m_terrain.get(9, 11), TileKind::DenseSoil);
    BOOST_CHECK_EQUAL(m_terrain.get(11, 11), TileKind::Soil);
    BOOST_CHECK_EQUAL(m_terrain.get(10, 10), TileKind::Surface);
}

BOOST_AUTO_TEST_CASE(TestDigFallsBackToDiagonal) {
    m_terrain.set(10, 11, TileKind::Tunnel);
    spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Digging);

    m_rng.queueInt(0);
    BOOST_CHECK_EQUAL(m_controller.applyDigging(m_ctx), 1u);
    BOOST_CHECK_EQUAL(m_terrain.get(9, 11), TileKind::Tunnel);
}

BOOST_AUTO_TEST_CASE(TestFailedRollDigsNothing) {
    spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Digging);
    BOOST_CHECK_EQUAL(m_controller.applyDigging(m_ctx), 0u);
    BOOST_CHECK_EQUAL(m_terrain.get(10, 11), TileKind::Soil);
}

BOOST_AUTO_TEST_CASE(TestSharedTargetDugOnce) {
    spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Digging);
    spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Digging);

    m_rng.queueInts({0, 0});
    BOOST_CHECK_EQUAL(m_controller.applyDigging(m_ctx), 1u);
    BOOST_CHECK_EQUAL(m_terrain.get(10, 11), TileKind::Tunnel);
}

BOOST_AUTO_TEST_CASE(TestOnlyDiggingWorkersDig) {
    spawn(m_surface, 0, AgentRole::Worker, BehaviorState::Wandering);
    spawn(m_surface, 0, AgentRole::Soldier, BehaviorState::Wandering);
    m_rng.setFallbackInt(0);

    BOOST_CHECK_EQUAL(m_controller.applyDigging(m_ctx), 0u);
    BOOST_CHECK_EQUAL(m_terrain.get(10, 11), TileKind::Soil);
}

BOOST_AUTO_TEST_SUITE_END()
