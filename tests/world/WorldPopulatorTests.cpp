/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE WorldPopulatorTests
#include <boost/test/unit_test.hpp>

#include "controllers/common/ColonyTestFixture.hpp"
#include "utils/RandomSource.hpp"
#include "world/WorldPopulator.hpp"

using namespace Formicary;

struct PopulatorFixture : public ColonyTestFixture {
    MersenneRandomSource m_seeded{1234};

    // Open cavern across the whole width from row 14 down to the dense layer
    void carveCavern() { m_terrain.fillRect(0, 14, WIDTH - 1, DENSE_ROW - 1, TileKind::Open); }
};

BOOST_FIXTURE_TEST_SUITE(WorldPopulatorTestSuite, PopulatorFixture)

BOOST_AUTO_TEST_CASE(TestColumnQueries) {
    BOOST_CHECK_EQUAL(*WorldPopulator::surfaceRow(m_terrain, 5), SURFACE_ROW);
    // Surface tiles are walkable, the ground starts below them
    BOOST_CHECK_EQUAL(*WorldPopulator::groundRow(m_terrain, 5), SURFACE_ROW + 1);

    digTunnel(5, SURFACE_ROW + 1, 5, 15);
    BOOST_CHECK_EQUAL(*WorldPopulator::groundRow(m_terrain, 5), 16);

    TileGrid sky(10, 10);
    BOOST_CHECK(!WorldPopulator::surfaceRow(sky, 3).has_value());
    BOOST_CHECK(!WorldPopulator::groundRow(sky, 3).has_value());
}

BOOST_AUTO_TEST_CASE(TestColoniesSpreadOut) {
    WorldPopulator populator(m_config, m_rng);

    // Every roll lands on the last column, the second colony falls back to a scan
    BOOST_CHECK_EQUAL(populator.placeColonies(m_terrain, m_agents, m_colonies), 2u);
    BOOST_CHECK_EQUAL(m_colonies.get(0)->home, TileCoord(29, SURFACE_ROW));
    BOOST_CHECK_EQUAL(m_colonies.get(1)->home, TileCoord(10, SURFACE_ROW));
    BOOST_CHECK_EQUAL(m_colonies.get(0)->foodStored, m_config.colony.initialFood);
}

BOOST_AUTO_TEST_CASE(TestColonyStartingPopulation) {
    WorldPopulator populator(m_config, m_seeded);
    BOOST_REQUIRE_EQUAL(populator.placeColonies(m_terrain, m_agents, m_colonies), 2u);

    for (uint8_t colony = 0; colony < 2; ++colony) {
        BOOST_CHECK_EQUAL(m_agents.countLive(colony, AgentRole::Queen), 1u);
        BOOST_CHECK_EQUAL(m_agents.countLive(colony, AgentRole::Worker), m_config.spawn.initialWorkers);
    }

    for (const Agent& a : m_agents.agents()) {
        BOOST_CHECK(m_terrain.isPassable(a.position.x, a.position.y));
        BOOST_REQUIRE(a.age.has_value());
        BOOST_CHECK_EQUAL(a.age->ticks, 0u);
        uint32_t expected = a.role() == AgentRole::Queen ? m_config.lifecycle.queenLifespan
                                                         : m_config.lifecycle.workerLifespan;
        BOOST_CHECK_EQUAL(a.age->maxTicks, expected);
    }
}

BOOST_AUTO_TEST_CASE(TestWorkersSpillBackToHome) {
    WorldPopulator populator(m_config, m_rng);
    populator.placeColonies(m_terrain, m_agents, m_colonies);

    // First five stand on the surface around the queen, the rest would be in soil
    const TileCoord home = m_colonies.get(0)->home;
    size_t atHome = 0;
    for (const Agent& a : m_agents.agents()) {
        if (a.colonyId == 0 && a.role() == AgentRole::Worker && a.position == home) {
            ++atHome;
        }
    }
    BOOST_CHECK_EQUAL(atHome, 6u);
}

BOOST_AUTO_TEST_CASE(TestColonyCountLimitedByRegistry) {
    m_config.spawn.numColonies = 4;
    m_config.spawn.minColonyDistance = 1;
    ColonyRegistry small(1);
    WorldPopulator populator(m_config, m_seeded);

    BOOST_CHECK_EQUAL(populator.placeColonies(m_terrain, m_agents, small), 1u);
    BOOST_CHECK_EQUAL(small.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestFoodRestsOnSurface) {
    WorldPopulator populator(m_config, m_seeded);
    BOOST_CHECK_EQUAL(populator.placeFoodSources(m_terrain, m_agents), m_config.food.numSources);

    for (const FoodSource& source : m_agents.foodSources()) {
        BOOST_CHECK_EQUAL(source.position.y, SURFACE_ROW);
        BOOST_CHECK_EQUAL(source.amount, m_config.food.initialAmount);
        BOOST_CHECK_EQUAL(source.spawnAmount, m_config.food.initialAmount);
    }
}

BOOST_AUTO_TEST_CASE(TestAphidsNeedCaves) {
    WorldPopulator populator(m_config, m_seeded);
    BOOST_CHECK_EQUAL(populator.placeAphids(m_terrain, m_agents), 0u);

    carveCavern();
    BOOST_CHECK_EQUAL(populator.placeAphids(m_terrain, m_agents), m_config.spawn.numAphids);
    for (const Aphid& aphid : m_agents.aphids()) {
        BOOST_CHECK(m_terrain.isPassable(aphid.position.x, aphid.position.y));
        BOOST_CHECK_GT(aphid.position.y, SURFACE_ROW);
        BOOST_CHECK(!aphid.ownerColony.has_value());
    }
}

BOOST_AUTO_TEST_CASE(TestSpringsInLowerHalf) {
    WorldPopulator populator(m_config, m_seeded);
    BOOST_CHECK_EQUAL(populator.placeWaterSources(m_terrain, m_water), 0u);
    BOOST_CHECK_EQUAL(m_water.totalDepth(), 0u);

    carveCavern();
    BOOST_CHECK_EQUAL(populator.placeWaterSources(m_terrain, m_water), m_config.water.numSources);
    BOOST_CHECK_GT(m_water.totalDepth(), 0u);
    for (int32_t y = 0; y < HEIGHT / 2; ++y) {
        for (int32_t x = 0; x < WIDTH; ++x) {
            BOOST_CHECK_EQUAL(static_cast<int>(m_water.depth(x, y)), 0);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestPopulateFailsWithoutSurface) {
    TileGrid sky(WIDTH, HEIGHT);
    WorldPopulator populator(m_config, m_seeded);
    BOOST_CHECK(!populator.populate(sky, m_agents, m_colonies, m_water));
    BOOST_CHECK_EQUAL(m_agents.getAgentCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestPopulateWholeWorld) {
    carveCavern();
    WorldPopulator populator(m_config, m_seeded);
    BOOST_CHECK(populator.populate(m_terrain, m_agents, m_colonies, m_water));
    BOOST_CHECK_EQUAL(m_colonies.size(), 2u);
    BOOST_CHECK_EQUAL(m_agents.foodSources().size(), m_config.food.numSources);
    BOOST_CHECK_EQUAL(m_agents.aphids().size(), m_config.spawn.numAphids);
}

BOOST_AUTO_TEST_SUITE_END()
