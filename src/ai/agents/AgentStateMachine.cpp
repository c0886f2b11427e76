/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/agents/AgentStateMachine.hpp"

namespace ArenaEngine {
namespace AgentStateMachine {

LayerMask excludedLayersFor(AgentState state) {
    switch (state) {
        case AgentState::SEEKING: return layerMaskOf(LayerId::PORTAL_OUT);
        case AgentState::RETURNING: return layerMaskOf(LayerId::PORTAL_IN);
    }
    return LayerMask{};
}

CellCoord destinationFor(AgentState state, const GridModel& grid) {
    switch (state) {
        case AgentState::SEEKING: return grid.goalCell;
        case AgentState::RETURNING: return grid.spawnCell;
    }
    return grid.goalCell;
}

ArrivalOutcome evaluateArrival(Agent& agent, const GridModel& grid, const ArrivalConfig& config) {
    if (!agent.path || !agent.path->isFinalWaypoint()) {
        return ArrivalOutcome::NONE;
    }
    const float distance = Vector2D::distance(agent.position, agent.path->next);
    const CellCoord cell = GridModel::cellAt(agent.position);

    switch (agent.state) {
        case AgentState::SEEKING:
            if (distance < config.goalArrivalRadius && cell == grid.goalCell) {
                agent.path.reset();
                agent.state = AgentState::RETURNING;
                return ArrivalOutcome::REACHED_GOAL;
            }
            return ArrivalOutcome::NONE;
        case AgentState::RETURNING:
            if (distance < config.homeArrivalRadius && cell == grid.spawnCell) {
                return ArrivalOutcome::DELIVERED;
            }
            return ArrivalOutcome::NONE;
    }
    return ArrivalOutcome::NONE;
}

} // namespace AgentStateMachine
} // namespace ArenaEngine
