/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STEERING_CONTROLLER_HPP
#define STEERING_CONTROLLER_HPP

#include "ai/SimulationConfig.hpp"
#include "controllers/SimulationPhase.hpp"

namespace ArenaEngine {

/**
 * @brief Moves agents along their waypoints.
 *
 * Velocity follows the desired velocity (direction to the waypoint at max
 * speed) with a first-order lag, is clamped to max speed and is damped
 * when an agent would overshoot its final waypoint. Waypoints are popped
 * inside the waypoint radius. Agents without a path coast to a stop.
 */
class SteeringController : public SimulationPhase
{
public:
    SteeringController(const SteeringConfig& steering, const ArrivalConfig& arrival);

    void update(float deltaTime, SimulationContext& ctx) override;
    const char* getName() const override { return "SteeringController"; }

    // Integrates one agent for one tick
    void steer(Agent& agent, float deltaTime) const;

    // Heading angle for a velocity; matches the presentation's yaw convention
    static float headingFor(const Vector2D& velocity);

private:
    SteeringConfig m_steering;
    ArrivalConfig m_arrival;
};

} // namespace ArenaEngine

#endif // STEERING_CONTROLLER_HPP
