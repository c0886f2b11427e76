/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/PathAssigner.hpp"
#include "ai/agents/AgentStateMachine.hpp"
#include "core/Logger.hpp"
#include <string>

namespace ArenaEngine {

PathAssigner::PathAssigner(const ReplanConfig& config) : m_config(config) {}

void PathAssigner::onLevelStart(SimulationContext& /*ctx*/)
{
    m_cooldown.reset();
}

void PathAssigner::onSurfaceRebuilt(SimulationContext& /*ctx*/)
{
    // Earlier failures were against the old surface
    m_cooldown.reset();
}

void PathAssigner::update(float deltaTime, SimulationContext& ctx)
{
    if (m_cooldown) {
        if (!m_cooldown->tick(deltaTime)) {
            return;
        }
        m_cooldown.reset();
    }
    if (!ctx.planner) {
        return;
    }

    bool attempted = false;
    for (Agent& agent : ctx.agents.getAgents()) {
        if (agent.path || agent.parked) {
            continue;
        }
        attempted = true;

        const Vector2D destination =
            GridModel::cellCenter(AgentStateMachine::destinationFor(agent.state, ctx.grid));
        auto waypoints = ctx.planner->plan(agent.position, destination,
                                           AgentStateMachine::excludedLayersFor(agent.state),
                                           agent.avoidanceDelta);
        if (!waypoints) {
            REPLANNER_INFO("No path for idle agent " + std::to_string(agent.id) + ", level blocked");
            ctx.setPathStatus(PathStatus::BLOCKED);
            m_cooldown.emplace(m_config.idleRetryCooldown);
            return;
        }

        agent.path = PathAssignment::fromWaypoints(*waypoints, m_config.revalidateInterval);
        ctx.setPathStatus(PathStatus::OPEN);
        REPLANNER_DEBUG("Agent " + std::to_string(agent.id) + " assigned " +
                        std::to_string(waypoints->size()) + " waypoints");
    }

    // Nobody left to retry the blocked request, let the spawner probe again
    if (!attempted && ctx.pathStatus == PathStatus::BLOCKED) {
        REPLANNER_INFO("No idle agents left, reopening spawning");
        ctx.setPathStatus(PathStatus::OPEN);
    }
}

} // namespace ArenaEngine
