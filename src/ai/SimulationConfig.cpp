/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/SimulationConfig.hpp"

namespace ArenaEngine
{

namespace
{

bool requirePositive(float value, const char* name, std::string& outError)
{
    if (value > 0.0f) {
        return true;
    }
    outError = std::string(name) + " must be positive, got " + std::to_string(value);
    return false;
}

} // anonymous namespace

bool SimulationConfig::validate(std::string& outError) const
{
    if (!requirePositive(steering.maxSpeed, "steering.maxSpeed", outError) ||
        !requirePositive(steering.overshootDamping, "steering.overshootDamping", outError) ||
        !requirePositive(steering.idleDamping, "steering.idleDamping", outError) ||
        !requirePositive(arrival.waypointRadius, "arrival.waypointRadius", outError) ||
        !requirePositive(arrival.goalArrivalRadius, "arrival.goalArrivalRadius", outError) ||
        !requirePositive(arrival.homeArrivalRadius, "arrival.homeArrivalRadius", outError) ||
        !requirePositive(spawner.initialDelayWithMessage, "spawner.initialDelayWithMessage", outError) ||
        !requirePositive(spawner.initialDelay, "spawner.initialDelay", outError) ||
        !requirePositive(replan.idleRetryCooldown, "replan.idleRetryCooldown", outError) ||
        !requirePositive(replan.revalidateInterval, "replan.revalidateInterval", outError) ||
        !requirePositive(replan.failureCooldown, "replan.failureCooldown", outError) ||
        !requirePositive(replan.baseAvoidanceDelta, "replan.baseAvoidanceDelta", outError)) {
        return false;
    }

    if (steering.overshootDamping > 1.0f || steering.idleDamping > 1.0f) {
        outError = "damping factors must not exceed 1";
        return false;
    }
    if (planner.seamPenaltyScale < 0.0f) {
        outError = "planner.seamPenaltyScale must not be negative";
        return false;
    }
    if (planner.maxSearchIterations <= 0) {
        outError = "planner.maxSearchIterations must be positive";
        return false;
    }
    if (replan.backoffFactor <= 1.0f) {
        outError = "replan.backoffFactor must be greater than 1";
        return false;
    }
    if (replan.avoidanceCeiling < replan.baseAvoidanceDelta) {
        outError = "replan.avoidanceCeiling must not be below replan.baseAvoidanceDelta";
        return false;
    }
    return true;
}

} // namespace ArenaEngine
