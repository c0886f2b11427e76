/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_STATE_MACHINE_HPP
#define AGENT_STATE_MACHINE_HPP

#include <cstdint>
#include <ostream>
#include "ai/SimulationConfig.hpp"
#include "ai/agents/Agent.hpp"
#include "ai/navigation/NavigationSurface.hpp"
#include "world/GridModel.hpp"

namespace ArenaEngine {

enum class ArrivalOutcome : uint8_t {
    NONE,
    REACHED_GOAL,   // SEEKING -> RETURNING happened
    DELIVERED       // RETURNING agent is home; the caller removes it
};

inline std::ostream& operator<<(std::ostream& os, const ArrivalOutcome& outcome) {
    switch (outcome) {
        case ArrivalOutcome::NONE: return os << "NONE";
        case ArrivalOutcome::REACHED_GOAL: return os << "REACHED_GOAL";
        case ArrivalOutcome::DELIVERED: return os << "DELIVERED";
        default: return os << "UNKNOWN";
    }
}

/**
 * Transitions of the agent lifecycle: SEEKING -> RETURNING -> delivered.
 * Destruction by collision is decided by the CollisionResolver.
 */
namespace AgentStateMachine {

// Seeking agents stay off the out-portal plane, returning agents off the in-portal plane
LayerMask excludedLayersFor(AgentState state);

// Cell the agent is heading for in its current state
CellCoord destinationFor(AgentState state, const GridModel& grid);

/**
 * Applies the arrival transition for an agent on its final waypoint.
 * A SEEKING agent inside the goal radius of the goal cell switches to
 * RETURNING and drops its path. A RETURNING agent inside the home radius of
 * the spawn cell reports DELIVERED.
 */
ArrivalOutcome evaluateArrival(Agent& agent, const GridModel& grid, const ArrivalConfig& config);

} // namespace AgentStateMachine

} // namespace ArenaEngine

#endif // AGENT_STATE_MACHINE_HPP
