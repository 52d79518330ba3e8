/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE AgentDataManagerTests
#include <boost/test/unit_test.hpp>

#include "managers/AgentCommandBuffer.hpp"
#include "managers/AgentDataManager.hpp"
#include <vector>

using Formicary::TileCoord;

struct AgentDataManagerFixture {
    AgentDataManager agents;
    AgentCommandBuffer commands;
};

BOOST_FIXTURE_TEST_SUITE(AgentDataManagerTestSuite, AgentDataManagerFixture)

BOOST_AUTO_TEST_CASE(TestSpawnIssuesIncreasingIds) {
    AgentHandle a = agents.spawnAgent(TileCoord(1, 1), 0, AgentRole::Worker);
    AgentHandle b = agents.spawnAgent(TileCoord(2, 1), 1, AgentRole::Soldier);

    BOOST_CHECK(a.isValid());
    BOOST_CHECK(a < b);
    BOOST_CHECK_EQUAL(agents.getAgentCount(), 2u);
    BOOST_REQUIRE(agents.getAgent(b) != nullptr);
    BOOST_CHECK_EQUAL(agents.getAgent(b)->colonyId, 1);
    BOOST_CHECK_EQUAL(agents.getAgent(b)->role(), AgentRole::Soldier);
}

BOOST_AUTO_TEST_CASE(TestSpawnAttachesAge) {
    AgentHandle egg = agents.spawnAgent(TileCoord(0, 0), 0, AgentRole::Egg, AgeCounter{0, 200});
    AgentHandle worker = agents.spawnAgent(TileCoord(0, 0), 0, AgentRole::Worker);

    BOOST_REQUIRE(agents.getAgent(egg)->age.has_value());
    BOOST_CHECK_EQUAL(agents.getAgent(egg)->age->maxTicks, 200u);
    BOOST_CHECK(!agents.getAgent(worker)->age.has_value());
}

BOOST_AUTO_TEST_CASE(TestTombstoneDefersRemoval) {
    AgentHandle a = agents.spawnAgent(TileCoord(1, 1), 0, AgentRole::Worker);
    AgentHandle b = agents.spawnAgent(TileCoord(2, 2), 0, AgentRole::Worker);

    BOOST_CHECK(agents.markForDestruction(a));
    BOOST_CHECK(!agents.markForDestruction(a));

    // Still addressable until the sweep
    BOOST_REQUIRE(agents.getAgent(a) != nullptr);
    BOOST_CHECK(!agents.getAgent(a)->isAlive());
    BOOST_CHECK_EQUAL(agents.countLive(0, AgentRole::Worker), 1u);

    BOOST_CHECK_EQUAL(agents.processDestructionQueue(), 1u);
    BOOST_CHECK(agents.getAgent(a) == nullptr);
    BOOST_CHECK(!agents.isValidHandle(a));
    BOOST_REQUIRE(agents.getAgent(b) != nullptr);
    BOOST_CHECK_EQUAL(agents.getAgent(b)->position, TileCoord(2, 2));
}

BOOST_AUTO_TEST_CASE(TestRemovalCallbackSeesEveryTombstone) {
    AgentHandle queen = agents.spawnAgent(TileCoord(5, 5), 2, AgentRole::Queen);
    agents.spawnAgent(TileCoord(6, 5), 2, AgentRole::Worker);
    AgentHandle soldier = agents.spawnAgent(TileCoord(7, 5), 2, AgentRole::Soldier);
    agents.markForDestruction(queen);
    agents.markForDestruction(soldier);

    std::vector<AgentRole> removed;
    size_t count = agents.processDestructionQueue([&](const Agent& a) { removed.push_back(a.role()); });

    BOOST_CHECK_EQUAL(count, 2u);
    BOOST_REQUIRE_EQUAL(removed.size(), 2u);
    BOOST_CHECK_EQUAL(removed[0], AgentRole::Queen);
    BOOST_CHECK_EQUAL(removed[1], AgentRole::Soldier);
    BOOST_CHECK_EQUAL(agents.getAgentCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestIdsNeverReused) {
    AgentHandle a = agents.spawnAgent(TileCoord(0, 0), 0, AgentRole::Worker);
    agents.markForDestruction(a);
    agents.processDestructionQueue();
    AgentHandle b = agents.spawnAgent(TileCoord(0, 0), 0, AgentRole::Worker);

    BOOST_CHECK(a != b);
    BOOST_CHECK(agents.getAgent(a) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestFoodSourcesAndAphids) {
    uint32_t food = agents.addFoodSource(TileCoord(3, 9), 100, 1);
    uint32_t aphid = agents.addAphid(TileCoord(4, 14), 0.1f);

    BOOST_CHECK_EQUAL(food, 0u);
    BOOST_CHECK_EQUAL(aphid, 0u);
    BOOST_CHECK_EQUAL(agents.foodSources()[0].spawnAmount, 100u);
    BOOST_CHECK(!agents.aphids()[0].ownerColony.has_value());

    agents.clear();
    BOOST_CHECK(agents.foodSources().empty());
    BOOST_CHECK(agents.aphids().empty());
}

// --- Command buffer ---

BOOST_AUTO_TEST_CASE(TestCommandsApplyInOrder) {
    AgentHandle worker = agents.spawnAgent(TileCoord(1, 1), 0, AgentRole::Worker);
    commands.push(AgentCommand::Move{worker, TileCoord(2, 1)});
    commands.push(AgentCommand::Move{worker, TileCoord(3, 1)});

    BOOST_CHECK_EQUAL(commands.apply(agents), 2u);
    BOOST_CHECK(commands.empty());
    BOOST_CHECK_EQUAL(agents.getAgent(worker)->position, TileCoord(3, 1));
}

BOOST_AUTO_TEST_CASE(TestCommandsToTombstonedAgentsDropped) {
    AgentHandle worker = agents.spawnAgent(TileCoord(1, 1), 0, AgentRole::Worker);
    commands.push(AgentCommand::Tombstone{worker});
    commands.push(AgentCommand::Move{worker, TileCoord(9, 9)});

    BOOST_CHECK_EQUAL(commands.apply(agents), 1u);
    BOOST_CHECK_EQUAL(agents.getAgent(worker)->position, TileCoord(1, 1));
}

BOOST_AUTO_TEST_CASE(TestIllegalTransitionRefused) {
    AgentHandle soldier = agents.spawnAgent(TileCoord(1, 1), 0, AgentRole::Soldier);
    commands.push(AgentCommand::Transition{soldier, BehaviorState::Digging});
    commands.push(AgentCommand::BeginCarry{soldier, 10});

    BOOST_CHECK_EQUAL(commands.apply(agents), 0u);
    BOOST_CHECK_EQUAL(agents.getAgent(soldier)->state(), BehaviorState::Wandering);
    BOOST_CHECK(!agents.getAgent(soldier)->carried.has_value());
}

BOOST_AUTO_TEST_CASE(TestCarryCycle) {
    AgentHandle worker = agents.spawnAgent(TileCoord(1, 1), 0, AgentRole::Worker);
    commands.push(AgentCommand::BeginCarry{worker, 7});
    commands.apply(agents);

    const Agent* a = agents.getAgent(worker);
    BOOST_CHECK_EQUAL(a->state(), BehaviorState::Carrying);
    BOOST_REQUIRE(a->carried.has_value());
    BOOST_CHECK_EQUAL(a->carried->amount, 7u);

    commands.push(AgentCommand::EndCarry{worker});
    BOOST_CHECK_EQUAL(commands.apply(agents), 1u);
    BOOST_CHECK_EQUAL(a->state(), BehaviorState::Wandering);
    BOOST_CHECK(!a->carried.has_value());
}

BOOST_AUTO_TEST_CASE(TestDamageAttachesHealthAndKills) {
    AgentHandle worker = agents.spawnAgent(TileCoord(1, 1), 0, AgentRole::Worker);
    commands.push(AgentCommand::Damage{worker, 20, 50, 10});
    commands.apply(agents);

    const Agent* a = agents.getAgent(worker);
    BOOST_REQUIRE(a->health.has_value());
    BOOST_CHECK_EQUAL(a->health->health, 30);
    BOOST_CHECK_EQUAL(a->health->strength, 10);

    commands.push(AgentCommand::Damage{worker, 40, 50, 10});
    commands.apply(agents);
    BOOST_CHECK(!a->isAlive());
    BOOST_CHECK(!a->health.has_value());
}

BOOST_AUTO_TEST_CASE(TestSpawnAndHatchCommands) {
    commands.push(AgentCommand::Spawn{TileCoord(4, 4), 1, AgentRole::Egg, AgeCounter{0, 200}});
    BOOST_CHECK_EQUAL(commands.apply(agents), 1u);
    BOOST_REQUIRE_EQUAL(agents.getAgentCount(), 1u);

    AgentHandle egg = agents.agents().front().handle;
    commands.push(AgentCommand::Hatch{egg, AgeCounter{0, 300}});
    commands.push(AgentCommand::Mature{egg, AgentRole::Worker, AgeCounter{0, 5000}});
    // Mature needs a larva, so it only takes after the hatch above
    BOOST_CHECK_EQUAL(commands.apply(agents), 2u);
    BOOST_CHECK_EQUAL(agents.getAgent(egg)->role(), AgentRole::Worker);
    BOOST_CHECK_EQUAL(agents.getAgent(egg)->age->maxTicks, 5000u);
}

BOOST_AUTO_TEST_CASE(TestSubmersionCommands) {
    AgentHandle worker = agents.spawnAgent(TileCoord(1, 1), 0, AgentRole::Worker);
    commands.push(AgentCommand::ClearSubmersion{worker});
    commands.push(AgentCommand::SetSubmersion{worker, 2});
    BOOST_CHECK_EQUAL(commands.apply(agents), 1u);
    BOOST_CHECK_EQUAL(agents.getAgent(worker)->submersion->ticks, 2u);

    commands.push(AgentCommand::ClearSubmersion{worker});
    BOOST_CHECK_EQUAL(commands.apply(agents), 1u);
    BOOST_CHECK(!agents.getAgent(worker)->submersion.has_value());
}

BOOST_AUTO_TEST_SUITE_END()
