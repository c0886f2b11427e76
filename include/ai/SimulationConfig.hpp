/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <string>

namespace ArenaEngine
{

/**
 * Configuration for the SteeringController
 *
 * Agents accelerate toward their current waypoint with a first-order lag
 * and are capped at maxSpeed.
 */
struct SteeringConfig
{
    float maxSpeed = 8.0f;                 // World units per second
    float overshootDamping = 0.9f;         // Velocity factor per tick when overshooting the final waypoint
    float idleDamping = 0.9f;              // Velocity factor per tick for agents without a path
    float minHeadingSpeed = 0.05f;         // Below this speed the previous orientation is kept
};

/**
 * Arrival radii used by waypoint popping and state transitions
 */
struct ArrivalConfig
{
    float waypointRadius = 0.8f;           // Pop the next waypoint inside this distance (maxSpeed / 10)
    float goalArrivalRadius = 1.0f;        // Seeking agents reach the goal inside this distance
    float homeArrivalRadius = 1.5f;        // Returning agents deliver inside this distance
};

/**
 * Spawner timing not carried by the level itself
 */
struct SpawnerConfig
{
    float initialDelayWithMessage = 7.5f;  // First spawn when the level shows an intro message
    float initialDelay = 1.5f;             // First spawn otherwise
};

/**
 * Path search parameters
 */
struct PlannerConfig
{
    float seamPenaltyScale = 4.0f;         // Extra cost per portal seam crossing, per unit of avoidance delta
    int maxSearchIterations = 20000;       // Node expansions before a search gives up
};

/**
 * Configuration for the Replanner
 *
 * Idle agents request a path with a shared cooldown after any failure.
 * Agents with a path re-validate it on a fixed interval; each failure widens
 * the agent's avoidance delta until it passes the ceiling and the agent is
 * parked until the next surface rebuild.
 */
struct ReplanConfig
{
    float idleRetryCooldown = 0.5f;        // Seconds before idle agents retry after a failed request
    float revalidateInterval = 0.4f;       // Seconds between re-validations of an assigned path
    float failureCooldown = 0.25f;         // Seconds before an agent retries a failed re-validation
    float baseAvoidanceDelta = 0.1f;
    float backoffFactor = 3.0f;            // Delta multiplier per failed re-validation
    float avoidanceCeiling = 10.0f;        // Delta above which the agent is parked
};

struct SimulationConfig
{
    SteeringConfig steering;
    ArrivalConfig arrival;
    SpawnerConfig spawner;
    PlannerConfig planner;
    ReplanConfig replan;

    /**
     * Checks value ranges.
     * @param outError receives a description of the first invalid value
     * @return true if every value is usable
     */
    bool validate(std::string& outError) const;
};

} // namespace ArenaEngine

#endif // SIMULATION_CONFIG_HPP
