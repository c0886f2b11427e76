/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ReplannerTests
#include <boost/test/unit_test.hpp>

#include "controllers/PathAssigner.hpp"
#include "controllers/Replanner.hpp"
#include "../common/SimulationTestFixture.hpp"

using namespace ArenaEngine;
using namespace ArenaTest;

namespace {

constexpr float DT = 0.1f;

} // namespace

struct ReplanFixture : SimulationTestFixture {
    ReplanFixture()
        : SimulationTestFixture(longCorridor()), assigner(config.replan), replanner(config.replan) {
        assigner.onLevelStart(ctx);
    }

    Agent& spawnIdle() {
        return ctx.agents.spawn(grid.spawnCenter(), 0.0f, config.replan.baseAvoidanceDelta);
    }

    Agent& firstAgent() { return ctx.agents.getAgents().front(); }

    uint64_t requests() const { return ctx.planner->getStats().totalRequests; }

    // Rebuild notification in phase order
    void notifyRebuilt() {
        assigner.onSurfaceRebuilt(ctx);
        replanner.onSurfaceRebuilt(ctx);
    }

    PathAssigner assigner;
    Replanner replanner;
};

BOOST_AUTO_TEST_SUITE(PathAssignmentTests)

BOOST_FIXTURE_TEST_CASE(TestIdleAgentGetsPath, ReplanFixture)
{
    spawnIdle();
    assigner.update(DT, ctx);

    BOOST_REQUIRE(firstAgent().path.has_value());
    std::vector<Vector2D> waypoints = firstAgent().path->toWaypoints();
    BOOST_CHECK(waypoints.back() == grid.goalCenter());
    BOOST_CHECK_EQUAL(ctx.pathStatus, PathStatus::OPEN);
    BOOST_CHECK(!assigner.isCoolingDown());
    BOOST_CHECK_CLOSE(firstAgent().path->revalidate.getDuration(), config.replan.revalidateInterval, 0.01f);
}

BOOST_FIXTURE_TEST_CASE(TestFailedRequestBlocksLevel, ReplanFixture)
{
    rebuild(ExclusionSet{CellCoord{5, 0}});
    spawnIdle();

    assigner.update(DT, ctx);
    BOOST_CHECK(!firstAgent().path.has_value());
    BOOST_CHECK_EQUAL(ctx.pathStatus, PathStatus::BLOCKED);
    BOOST_CHECK(assigner.isCoolingDown());
    BOOST_CHECK_EQUAL(countEvents(ArenaEventType::PATH_STATUS_CHANGED), 1u);
    BOOST_CHECK_EQUAL(requests(), 1u);
}

BOOST_FIXTURE_TEST_CASE(TestRetriesWaitForCooldown, ReplanFixture)
{
    rebuild(ExclusionSet{CellCoord{5, 0}});
    spawnIdle();

    for (int i = 0; i < 5; ++i) {
        assigner.update(DT, ctx);
    }
    BOOST_CHECK_EQUAL(requests(), 1u);

    assigner.update(DT, ctx);
    assigner.update(DT, ctx);
    BOOST_CHECK_EQUAL(requests(), 2u);
    BOOST_CHECK_EQUAL(ctx.pathStatus, PathStatus::BLOCKED);
}

BOOST_FIXTURE_TEST_CASE(TestRebuildClearsCooldown, ReplanFixture)
{
    rebuild(ExclusionSet{CellCoord{5, 0}});
    spawnIdle();
    assigner.update(DT, ctx);
    BOOST_REQUIRE(assigner.isCoolingDown());

    rebuild(ExclusionSet{});
    notifyRebuilt();
    BOOST_CHECK(!assigner.isCoolingDown());

    assigner.update(DT, ctx);
    BOOST_CHECK(firstAgent().path.has_value());
    BOOST_CHECK_EQUAL(ctx.pathStatus, PathStatus::OPEN);
}

BOOST_FIXTURE_TEST_CASE(TestBlockedWithoutIdleAgentsReopens, ReplanFixture)
{
    ctx.setPathStatus(PathStatus::BLOCKED);
    assigner.update(DT, ctx);
    BOOST_CHECK_EQUAL(ctx.pathStatus, PathStatus::OPEN);
}

BOOST_FIXTURE_TEST_CASE(TestParkedAgentsAreNotAssigned, ReplanFixture)
{
    spawnIdle().parked = true;
    assigner.update(DT, ctx);

    BOOST_CHECK(!firstAgent().path.has_value());
    BOOST_CHECK_EQUAL(requests(), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestFirstFailureStopsTheRound, ReplanFixture)
{
    rebuild(ExclusionSet{CellCoord{5, 0}});
    spawnIdle();
    spawnIdle();

    assigner.update(DT, ctx);
    BOOST_CHECK_EQUAL(requests(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RevalidationTests)

BOOST_FIXTURE_TEST_CASE(TestRevalidationRunsOnInterval, ReplanFixture)
{
    spawnIdle();
    assigner.update(DT, ctx);
    BOOST_REQUIRE(firstAgent().path.has_value());
    const uint64_t afterAssign = requests();

    replanner.update(0.3f, ctx);
    BOOST_CHECK_EQUAL(requests(), afterAssign);

    replanner.update(0.15f, ctx);
    BOOST_CHECK_EQUAL(requests(), afterAssign + 1);
}

BOOST_FIXTURE_TEST_CASE(TestSuccessfulRevalidationResetsDelta, ReplanFixture)
{
    spawnIdle();
    assigner.update(DT, ctx);
    BOOST_REQUIRE(firstAgent().path.has_value());
    firstAgent().avoidanceDelta = 0.9f;

    replanner.revalidate(firstAgent(), ctx);
    BOOST_CHECK_CLOSE(firstAgent().avoidanceDelta, config.replan.baseAvoidanceDelta, 0.01f);
    BOOST_CHECK(firstAgent().path.has_value());
    BOOST_CHECK(!firstAgent().parked);
}

BOOST_FIXTURE_TEST_CASE(TestRebuildForcesRevalidation, ReplanFixture)
{
    spawnIdle();
    assigner.update(DT, ctx);
    BOOST_REQUIRE(firstAgent().path.has_value());

    rebuild(ExclusionSet{});
    notifyRebuilt();
    replanner.update(1.0f / 60.0f, ctx);
    BOOST_CHECK_EQUAL(requests(), 1u);
}

BOOST_FIXTURE_TEST_CASE(TestBackoffWidensDeltaThenParks, ReplanFixture)
{
    spawnIdle();
    assigner.update(DT, ctx);
    BOOST_REQUIRE(firstAgent().path.has_value());

    rebuild(ExclusionSet{CellCoord{6, 0}});
    notifyRebuilt();

    replanner.update(1.0f / 60.0f, ctx);
    BOOST_CHECK_CLOSE(firstAgent().avoidanceDelta, 0.3f, 0.01f);
    BOOST_CHECK(firstAgent().path.has_value());

    const float expected[] = {0.9f, 2.7f, 8.1f};
    float previous = firstAgent().avoidanceDelta;
    for (float delta : expected) {
        replanner.update(config.replan.failureCooldown, ctx);
        BOOST_CHECK_CLOSE(firstAgent().avoidanceDelta, delta, 0.01f);
        BOOST_CHECK_GT(firstAgent().avoidanceDelta, previous);
        BOOST_CHECK(!firstAgent().parked);
        previous = firstAgent().avoidanceDelta;
    }

    replanner.update(config.replan.failureCooldown, ctx);
    BOOST_CHECK(firstAgent().parked);
    BOOST_CHECK(!firstAgent().path.has_value());
    BOOST_CHECK_EQUAL(countEvents(ArenaEventType::AGENT_PARKED), 1u);
    BOOST_CHECK_EQUAL(requests(), 5u);
}

BOOST_FIXTURE_TEST_CASE(TestParkedAgentsStopPlanning, ReplanFixture)
{
    spawnIdle();
    assigner.update(DT, ctx);
    rebuild(ExclusionSet{CellCoord{6, 0}});
    notifyRebuilt();

    for (int i = 0; i < 5; ++i) {
        replanner.update(config.replan.failureCooldown, ctx);
    }
    BOOST_REQUIRE(firstAgent().parked);
    const uint64_t atPark = requests();

    for (int i = 0; i < 50; ++i) {
        assigner.update(DT, ctx);
        replanner.update(DT, ctx);
    }
    BOOST_CHECK_EQUAL(requests(), atPark);
    BOOST_CHECK(!firstAgent().path.has_value());
}

BOOST_FIXTURE_TEST_CASE(TestRebuildUnparksAgents, ReplanFixture)
{
    spawnIdle();
    assigner.update(DT, ctx);
    rebuild(ExclusionSet{CellCoord{6, 0}});
    notifyRebuilt();
    for (int i = 0; i < 5; ++i) {
        replanner.update(config.replan.failureCooldown, ctx);
    }
    BOOST_REQUIRE(firstAgent().parked);

    rebuild(ExclusionSet{});
    notifyRebuilt();
    BOOST_CHECK(!firstAgent().parked);
    BOOST_CHECK_CLOSE(firstAgent().avoidanceDelta, config.replan.baseAvoidanceDelta, 0.01f);

    assigner.update(DT, ctx);
    BOOST_CHECK(firstAgent().path.has_value());
}

BOOST_AUTO_TEST_SUITE_END()
