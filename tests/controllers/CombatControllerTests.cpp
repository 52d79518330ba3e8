/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE CombatControllerTests
#include <boost/test/unit_test.hpp>

#include "controllers/colony/CombatController.hpp"
#include "controllers/common/ColonyTestFixture.hpp"

using Formicary::PheromoneType;
using Formicary::TileCoord;

struct CombatFixture : public ColonyTestFixture {
    CombatController m_controller;

    CombatFixture() {
        addColony(TileCoord(5, 10));
        addColony(TileCoord(35, 10));
    }

    float danger(TileCoord pos, uint8_t colony) const {
        return m_pheromones.get(pos.x, pos.y, colony, PheromoneType::Danger);
    }
};

BOOST_FIXTURE_TEST_SUITE(CombatControllerTestSuite, CombatFixture)

BOOST_AUTO_TEST_CASE(TestDamageByRole) {
    const auto& c = m_config.combat;
    // base + roll + strength / 10 - offset
    BOOST_CHECK_EQUAL(static_cast<int>(CombatController::computeDamage(AgentRole::Worker, 10, 0, c)), 6);
    BOOST_CHECK_EQUAL(static_cast<int>(CombatController::computeDamage(AgentRole::Soldier, 30, 9, c)), 27);
    BOOST_CHECK_EQUAL(static_cast<int>(CombatController::computeDamage(AgentRole::Queen, 5, 4, c)), 4);
}

BOOST_AUTO_TEST_CASE(TestDamageFloorsAtZero) {
    Formicary::CombatSettings weak = m_config.combat;
    weak.baseDamage = 2;
    weak.damageOffset = 40;
    BOOST_CHECK_EQUAL(static_cast<int>(CombatController::computeDamage(AgentRole::Worker, 10, 3, weak)), 0);
}

BOOST_AUTO_TEST_CASE(TestRoleStrength) {
    const auto& c = m_config.combat;
    BOOST_CHECK_EQUAL(CombatController::roleStrength(AgentRole::Soldier, c), c.soldierStrength);
    BOOST_CHECK_EQUAL(CombatController::roleStrength(AgentRole::Worker, c), c.workerStrength);
    BOOST_CHECK_EQUAL(CombatController::roleStrength(AgentRole::Queen, c), c.otherStrength);
}

BOOST_AUTO_TEST_CASE(TestEachPairFightsOnce) {
    AgentHandle a = spawn(TileCoord(20, 9), 0, AgentRole::Worker);
    AgentHandle b = spawn(TileCoord(21, 9), 1, AgentRole::Worker);
    rebuildSpatial();

    m_rng.queueInts({2, 4});
    BOOST_CHECK_EQUAL(m_controller.resolveCombat(m_ctx), 1u);

    // Worker hits for 6 + roll, one exchange each way
    BOOST_REQUIRE(agent(a).health.has_value());
    BOOST_REQUIRE(agent(b).health.has_value());
    BOOST_CHECK_EQUAL(static_cast<int>(agent(b).health->health), m_config.combat.defaultHealth - 8);
    BOOST_CHECK_EQUAL(static_cast<int>(agent(a).health->health), m_config.combat.defaultHealth - 10);
    BOOST_CHECK_EQUAL(m_rng.intDraws(), 2u);
}

BOOST_AUTO_TEST_CASE(TestEnemiesMeetingAfterIndexBuilt) {
    // Smallest cell size the config accepts
    Formicary::SpatialGrid grid(WIDTH, HEIGHT, 2);
    SimContext ctx{m_config, m_terrain, m_agents, m_colonies, grid,
                   m_pheromones, m_water, m_rng, 1};

    AgentHandle a = spawn(TileCoord(10, 9), 0, AgentRole::Soldier);
    AgentHandle b = spawn(TileCoord(13, 9), 1, AgentRole::Soldier);
    for (const Agent& each : m_agents.agents()) {
        grid.insert(each.handle, each.position, each.colonyId);
    }

    // Both step towards each other after the index was built
    agent(a).position = TileCoord(11, 9);
    agent(b).position = TileCoord(12, 9);

    BOOST_CHECK_EQUAL(m_controller.resolveCombat(ctx), 1u);
    BOOST_CHECK_EQUAL(m_rng.intDraws(), 2u);
}

BOOST_AUTO_TEST_CASE(TestAlliesAndDistantEnemiesIgnored) {
    AgentHandle a = spawn(TileCoord(20, 9), 0, AgentRole::Soldier);
    AgentHandle ally = spawn(TileCoord(21, 9), 0, AgentRole::Worker);
    AgentHandle far = spawn(TileCoord(23, 9), 1, AgentRole::Soldier);
    AgentHandle queen = spawn(TileCoord(19, 9), 1, AgentRole::Queen);
    rebuildSpatial();

    BOOST_CHECK_EQUAL(m_controller.resolveCombat(m_ctx), 0u);
    BOOST_CHECK(!agent(a).health.has_value());
    BOOST_CHECK(!agent(ally).health.has_value());
    BOOST_CHECK(!agent(far).health.has_value());
    BOOST_CHECK(!agent(queen).health.has_value());
}

BOOST_AUTO_TEST_CASE(TestDiagonalCountsAsAdjacent) {
    spawn(TileCoord(20, 9), 0, AgentRole::Worker);
    spawn(TileCoord(21, 8), 1, AgentRole::Worker);
    rebuildSpatial();
    BOOST_CHECK_EQUAL(m_controller.resolveCombat(m_ctx), 1u);
}

BOOST_AUTO_TEST_CASE(TestLethalBlowTombstones) {
    AgentHandle victim = spawn(TileCoord(20, 9), 0, AgentRole::Worker);
    AgentHandle soldier = spawn(TileCoord(21, 9), 1, AgentRole::Soldier);
    agent(victim).health = CombatHealth{10, 5};
    rebuildSpatial();

    m_controller.resolveCombat(m_ctx);
    BOOST_CHECK(!agent(victim).isAlive());
    BOOST_CHECK(agent(soldier).isAlive());
}

BOOST_AUTO_TEST_CASE(TestFightMarksDanger) {
    TileCoord posA(20, 9);
    TileCoord posB(21, 9);
    spawn(posA, 0, AgentRole::Worker);
    spawn(posB, 1, AgentRole::Worker);
    rebuildSpatial();

    m_controller.resolveCombat(m_ctx);
    BOOST_CHECK_CLOSE(danger(posA, 0), m_config.combat.dangerDeposit, 0.001f);
    BOOST_CHECK_CLOSE(danger(posB, 1), m_config.combat.dangerDeposit, 0.001f);
    BOOST_CHECK_SMALL(danger(posA, 1), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestSoldierFightsOnDanger) {
    TileCoord pos(20, 9);
    AgentHandle soldier = spawn(pos, 0, AgentRole::Soldier, BehaviorState::Wandering);
    m_pheromones.deposit(pos.x, pos.y, 0, PheromoneType::Danger, 0.2f);

    BOOST_CHECK_EQUAL(m_controller.updateSoldierStates(m_ctx), 1u);
    BOOST_CHECK_EQUAL(agent(soldier).state(), BehaviorState::Fighting);

    // Between the thresholds the soldier keeps fighting
    m_pheromones.clear();
    m_pheromones.deposit(pos.x, pos.y, 0, PheromoneType::Danger, 0.07f);
    BOOST_CHECK_EQUAL(m_controller.updateSoldierStates(m_ctx), 0u);

    m_pheromones.clear();
    BOOST_CHECK_EQUAL(m_controller.updateSoldierStates(m_ctx), 1u);
    BOOST_CHECK_EQUAL(agent(soldier).state(), BehaviorState::Wandering);
}

BOOST_AUTO_TEST_CASE(TestWorkerFleesAnyColonysDanger) {
    TileCoord pos(20, 9);
    AgentHandle worker = spawn(pos, 0, AgentRole::Worker, BehaviorState::Wandering);
    AgentHandle digger = spawn(pos, 0, AgentRole::Worker, BehaviorState::Digging);
    m_pheromones.deposit(pos.x, pos.y, 1, PheromoneType::Danger, 0.5f);

    BOOST_CHECK_EQUAL(m_controller.updateFleeStates(m_ctx), 2u);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Fleeing);
    BOOST_CHECK_EQUAL(agent(digger).state(), BehaviorState::Fleeing);

    m_pheromones.clear();
    BOOST_CHECK_EQUAL(m_controller.updateFleeStates(m_ctx), 2u);
    BOOST_CHECK_EQUAL(agent(worker).state(), BehaviorState::Wandering);
}

BOOST_AUTO_TEST_SUITE_END()
