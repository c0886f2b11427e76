/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SpawnerTests
#include <boost/test/unit_test.hpp>

#include "controllers/Spawner.hpp"
#include "../common/SimulationTestFixture.hpp"

using namespace ArenaEngine;
using namespace ArenaTest;

namespace {

constexpr float DT = 0.1f;

LevelSettings introSettings() {
    LevelSettings settings = makeSettings(1, 1.0f);
    settings.introMessage = "Guide the treasure hunters home";
    return settings;
}

} // namespace

struct SpawnerFixture : SimulationTestFixture {
    explicit SpawnerFixture(LevelSettings settings = makeSettings(2, 1.0f))
        : SimulationTestFixture(openLevel(std::move(settings))), spawner(config.spawner) {
        spawner.onLevelStart(ctx);
    }

    void run(float seconds) {
        runFor(seconds, DT, [this](float dt) { spawner.update(dt, ctx); });
    }

    Spawner spawner;
};

struct SingleCapFixture : SpawnerFixture {
    SingleCapFixture() : SpawnerFixture(makeSettings(1, 1.0f)) {}
};

struct IntroFixture : SpawnerFixture {
    IntroFixture() : SpawnerFixture(introSettings()) {}
};

BOOST_AUTO_TEST_SUITE(SpawnTimingTests)

BOOST_FIXTURE_TEST_CASE(TestFirstSpawnUsesShortInitialDelay, SpawnerFixture)
{
    spawner.update(DT, ctx);
    BOOST_CHECK(spawner.isTimerRunning());
    BOOST_CHECK_CLOSE(spawner.getTimeUntilSpawn(), 1.5f, 0.01f);

    run(1.4f);
    BOOST_CHECK(ctx.agents.empty());

    run(0.3f);
    BOOST_REQUIRE_EQUAL(ctx.agents.size(), 1u);
    BOOST_CHECK(ctx.agents.getAgents().front().position == grid.spawnCenter());
    BOOST_CHECK_EQUAL(countEvents(ArenaEventType::AGENT_SPAWNED), 1u);
}

BOOST_FIXTURE_TEST_CASE(TestIntroMessageLengthensFirstSpawn, IntroFixture)
{
    spawner.update(DT, ctx);
    BOOST_CHECK_CLOSE(spawner.getTimeUntilSpawn(), 7.5f, 0.01f);

    run(7.3f);
    BOOST_CHECK(ctx.agents.empty());

    run(0.5f);
    BOOST_CHECK_EQUAL(ctx.agents.size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(TestLaterSpawnsUseLevelInterval, SpawnerFixture)
{
    for (int i = 0; i < 100 && ctx.agents.empty(); ++i) {
        spawner.update(DT, ctx);
    }
    BOOST_REQUIRE_EQUAL(ctx.agents.size(), 1u);

    // Next tick arms the regular interval
    spawner.update(DT, ctx);
    BOOST_CHECK_CLOSE(spawner.getTimeUntilSpawn(), 1.0f, 0.01f);
}

BOOST_FIXTURE_TEST_CASE(TestSpawnedAgentsUseBaseDelta, SpawnerFixture)
{
    run(2.0f);
    BOOST_REQUIRE(!ctx.agents.empty());
    BOOST_CHECK_CLOSE(ctx.agents.getAgents().front().avoidanceDelta, config.replan.baseAvoidanceDelta, 0.001f);
    BOOST_CHECK(ctx.agents.getAgents().front().state == AgentState::SEEKING);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PopulationCapTests)

BOOST_FIXTURE_TEST_CASE(TestNeverExceedsCap, SpawnerFixture)
{
    for (int i = 0; i < 200; ++i) {
        spawner.update(DT, ctx);
        BOOST_REQUIRE_LE(ctx.agents.size(), 2u);
    }
    BOOST_CHECK_EQUAL(ctx.agents.size(), 2u);
    BOOST_CHECK_EQUAL(countEvents(ArenaEventType::AGENT_SPAWNED), 2u);
    BOOST_CHECK(!spawner.isTimerRunning());
}

BOOST_FIXTURE_TEST_CASE(TestSpawningResumesBelowCap, SpawnerFixture)
{
    run(10.0f);
    BOOST_REQUIRE_EQUAL(ctx.agents.size(), 2u);

    ctx.agents.destroy(ctx.agents.getAgents().front().id);
    run(0.5f);
    BOOST_CHECK_EQUAL(ctx.agents.size(), 1u);

    run(1.0f);
    BOOST_CHECK_EQUAL(ctx.agents.size(), 2u);
    BOOST_CHECK_EQUAL(countEvents(ArenaEventType::AGENT_SPAWNED), 3u);
}

BOOST_FIXTURE_TEST_CASE(TestCapIsCheckedWhenTimerFires, SingleCapFixture)
{
    spawner.update(DT, ctx);
    BOOST_REQUIRE(spawner.isTimerRunning());

    // Population fills up while the timer is running
    ctx.agents.spawn(Vector2D(4.0f, 0.0f), 0.0f, 0.1f);

    run(3.0f);
    BOOST_CHECK_EQUAL(ctx.agents.size(), 1u);
    BOOST_CHECK_EQUAL(countEvents(ArenaEventType::AGENT_SPAWNED), 0u);
    BOOST_CHECK(!spawner.isTimerRunning());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PathStatusGateTests)

BOOST_FIXTURE_TEST_CASE(TestBlockedSuspendsSpawning, SingleCapFixture)
{
    ctx.setPathStatus(PathStatus::BLOCKED);

    run(10.0f);
    BOOST_CHECK(ctx.agents.empty());
    BOOST_CHECK(!spawner.isTimerRunning());

    ctx.setPathStatus(PathStatus::OPEN);
    run(2.0f);
    BOOST_CHECK_EQUAL(ctx.agents.size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(TestBlockedFreezesRunningTimer, SingleCapFixture)
{
    spawner.update(DT, ctx);
    run(1.0f);
    BOOST_REQUIRE(spawner.isTimerRunning());
    const float remaining = spawner.getTimeUntilSpawn();

    ctx.setPathStatus(PathStatus::BLOCKED);
    run(5.0f);
    BOOST_CHECK(ctx.agents.empty());
    BOOST_CHECK_CLOSE(spawner.getTimeUntilSpawn(), remaining, 0.01f);

    ctx.setPathStatus(PathStatus::OPEN);
    run(0.8f);
    BOOST_CHECK_EQUAL(ctx.agents.size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(TestLevelStartReopensSpawning, SingleCapFixture)
{
    ctx.setPathStatus(PathStatus::BLOCKED);
    ctx.events.clear();

    spawner.onLevelStart(ctx);
    BOOST_CHECK(ctx.pathStatus == PathStatus::OPEN);
    BOOST_CHECK_EQUAL(countEvents(ArenaEventType::PATH_STATUS_CHANGED), 1u);
    BOOST_CHECK(!spawner.isTimerRunning());
}

BOOST_AUTO_TEST_SUITE_END()
