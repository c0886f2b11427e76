/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/SteeringController.hpp"
#include <cmath>
#include <numbers>

namespace ArenaEngine {

SteeringController::SteeringController(const SteeringConfig& steering, const ArrivalConfig& arrival)
    : m_steering(steering), m_arrival(arrival) {}

float SteeringController::headingFor(const Vector2D& velocity)
{
    float heading = -std::atan2(velocity.getY(), velocity.getX()) + std::numbers::pi_v<float> / 2.0f;
    if (heading > std::numbers::pi_v<float>) {
        heading -= 2.0f * std::numbers::pi_v<float>;
    }
    return heading;
}

void SteeringController::steer(Agent& agent, float deltaTime) const
{
    if (!agent.path) {
        agent.velocity *= m_steering.idleDamping;
        agent.position += agent.velocity * deltaTime;
        return;
    }

    PathAssignment& path = *agent.path;
    const Vector2D toWaypoint = path.next - agent.position;
    const Vector2D desired = toWaypoint.normalized() * m_steering.maxSpeed;

    agent.velocity += (desired - agent.velocity) * deltaTime;
    agent.velocity = agent.velocity.clampedTo(m_steering.maxSpeed);

    if (path.isFinalWaypoint() && agent.velocity.length() > toWaypoint.length()) {
        agent.velocity *= m_steering.overshootDamping;
    }

    if (agent.velocity.length() > m_steering.minHeadingSpeed) {
        agent.orientation = headingFor(agent.velocity);
    }

    agent.position += agent.velocity * deltaTime;

    if (!path.isFinalWaypoint() &&
        Vector2D::distance(agent.position, path.next) < m_arrival.waypointRadius) {
        path.advance();
    }
}

void SteeringController::update(float deltaTime, SimulationContext& ctx)
{
    for (Agent& agent : ctx.agents.getAgents()) {
        steer(agent, deltaTime);
    }
}

} // namespace ArenaEngine
