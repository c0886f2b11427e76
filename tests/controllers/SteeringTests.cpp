/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SteeringTests
#include <boost/test/unit_test.hpp>

#include "controllers/SteeringController.hpp"
#include "../common/SimulationTestFixture.hpp"
#include <numbers>

using namespace ArenaEngine;
using namespace ArenaTest;

namespace {

constexpr float DT = 1.0f / 60.0f;
constexpr float PI = std::numbers::pi_v<float>;

Agent agentOnPath(const Vector2D& position, const std::vector<Vector2D>& waypoints) {
    Agent agent;
    agent.id = 1;
    agent.position = position;
    agent.path = PathAssignment::fromWaypoints(waypoints, 0.4f);
    return agent;
}

} // namespace

struct SteeringFixture : SimulationTestFixture {
    SteeringFixture() : steering(config.steering, config.arrival) {}

    SteeringController steering;
};

BOOST_AUTO_TEST_SUITE(VelocityTests)

BOOST_FIXTURE_TEST_CASE(TestVelocityLagsTowardDesired, SteeringFixture)
{
    Agent agent = agentOnPath(Vector2D(0, 0), {Vector2D(0, 0), Vector2D(100, 0)});

    steering.steer(agent, 0.1f);
    BOOST_CHECK_CLOSE(agent.velocity.getX(), 0.8f, 0.01f);
    BOOST_CHECK_SMALL(agent.velocity.getY(), 1e-6f);
    BOOST_CHECK_CLOSE(agent.position.getX(), 0.08f, 0.01f);
}

BOOST_FIXTURE_TEST_CASE(TestSpeedIsClamped, SteeringFixture)
{
    Agent agent = agentOnPath(Vector2D(0, 0), {Vector2D(0, 0), Vector2D(0, 100)});
    agent.velocity = Vector2D(50.0f, 0.0f);

    steering.steer(agent, DT);
    BOOST_CHECK_LE(agent.velocity.length(), config.steering.maxSpeed + 1e-4f);
}

BOOST_FIXTURE_TEST_CASE(TestOvershootIsDampedOnFinalWaypoint, SteeringFixture)
{
    Agent agent = agentOnPath(Vector2D(0, 0), {Vector2D(0, 0), Vector2D(1, 0)});
    agent.velocity = Vector2D(8.0f, 0.0f);

    steering.steer(agent, 0.1f);
    BOOST_CHECK_CLOSE(agent.velocity.getX(), 7.2f, 0.01f);
}

BOOST_FIXTURE_TEST_CASE(TestNoDampingBeforeFinalWaypoint, SteeringFixture)
{
    Agent agent = agentOnPath(Vector2D(0, 0), {Vector2D(0, 0), Vector2D(1, 0), Vector2D(50, 0)});
    agent.velocity = Vector2D(8.0f, 0.0f);

    steering.steer(agent, 0.1f);
    BOOST_CHECK_CLOSE(agent.velocity.getX(), 8.0f, 0.01f);

    // Moved to 0.8, inside the waypoint radius of (1, 0)
    BOOST_REQUIRE(agent.path.has_value());
    BOOST_CHECK(agent.path->next == Vector2D(50, 0));
    BOOST_CHECK(agent.path->isFinalWaypoint());
}

BOOST_FIXTURE_TEST_CASE(TestIdleAgentsCoast, SteeringFixture)
{
    Agent agent;
    agent.velocity = Vector2D(2.0f, 0.0f);

    steering.steer(agent, 0.5f);
    BOOST_CHECK_CLOSE(agent.velocity.getX(), 1.8f, 0.01f);
    BOOST_CHECK_CLOSE(agent.position.getX(), 0.9f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(HeadingTests)

BOOST_AUTO_TEST_CASE(TestHeadingFromVelocity)
{
    BOOST_CHECK_SMALL(SteeringController::headingFor(Vector2D(0, 1)), 1e-6f);
    BOOST_CHECK_CLOSE(SteeringController::headingFor(Vector2D(1, 0)), PI / 2.0f, 0.001f);
    BOOST_CHECK_CLOSE(SteeringController::headingFor(Vector2D(-1, 0)), -PI / 2.0f, 0.001f);
    BOOST_CHECK_CLOSE(SteeringController::headingFor(Vector2D(0, -1)), PI, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestSlowAgentsKeepHeading, SteeringFixture)
{
    Agent agent = agentOnPath(Vector2D(5, 5), {Vector2D(5, 5)});
    agent.orientation = 1.0f;

    steering.steer(agent, DT);
    BOOST_CHECK_CLOSE(agent.orientation, 1.0f, 0.001f);
}

BOOST_FIXTURE_TEST_CASE(TestHeadingFollowsMotion, SteeringFixture)
{
    Agent agent = agentOnPath(Vector2D(0, 0), {Vector2D(0, 0), Vector2D(0, 40)});

    for (int i = 0; i < 30; ++i) {
        steering.steer(agent, DT);
    }
    BOOST_CHECK_SMALL(agent.orientation, 1e-4f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ArrivalConvergenceTests)

BOOST_FIXTURE_TEST_CASE(TestAgentReachesGoalOnOpenFloor, SteeringFixture)
{
    auto waypoints = ctx.planner->plan(grid.spawnCenter(), grid.goalCenter(), LayerMask{}, 0.1f);
    BOOST_REQUIRE(waypoints.has_value());

    Agent agent = agentOnPath(grid.spawnCenter(), *waypoints);

    constexpr int MAX_TICKS = 1200;
    int ticks = 0;
    while (ticks < MAX_TICKS && Vector2D::distance(agent.position, grid.goalCenter()) >= 1.0f) {
        steering.steer(agent, DT);
        ++ticks;
    }

    BOOST_CHECK_LT(ticks, MAX_TICKS);
    BOOST_CHECK_LT(Vector2D::distance(agent.position, grid.goalCenter()), 1.0f);
    BOOST_REQUIRE(agent.path.has_value());
    BOOST_CHECK(agent.path->isFinalWaypoint());
}

BOOST_FIXTURE_TEST_CASE(TestAgentSettlesWithoutOrbiting, SteeringFixture)
{
    Agent agent = agentOnPath(Vector2D(0, 8), {Vector2D(0, 8), Vector2D(12, 8)});

    for (int i = 0; i < 900; ++i) {
        steering.steer(agent, DT);
    }
    BOOST_CHECK_LT(Vector2D::distance(agent.position, Vector2D(12, 8)), 0.5f);
    BOOST_CHECK_LT(agent.velocity.length(), 1.0f);
}

BOOST_FIXTURE_TEST_CASE(TestUpdateSteersEveryAgent, SteeringFixture)
{
    Agent& first = ctx.agents.spawn(Vector2D(0, 0), 0.0f, 0.1f);
    first.path = PathAssignment::fromWaypoints({Vector2D(0, 0), Vector2D(10, 0)}, 0.4f);
    Agent& second = ctx.agents.spawn(Vector2D(0, 8), 0.0f, 0.1f);
    second.path = PathAssignment::fromWaypoints({Vector2D(0, 8), Vector2D(0, 16)}, 0.4f);

    steering.update(0.1f, ctx);

    BOOST_CHECK_GT(ctx.agents.getAgents()[0].position.getX(), 0.0f);
    BOOST_CHECK_GT(ctx.agents.getAgents()[1].position.getY(), 8.0f);
}

BOOST_AUTO_TEST_SUITE_END()
