/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/Replanner.hpp"
#include "ai/agents/AgentStateMachine.hpp"
#include "core/Logger.hpp"
#include <string>

namespace ArenaEngine {

Replanner::Replanner(const ReplanConfig& config) : m_config(config) {}

void Replanner::revalidate(Agent& agent, SimulationContext& ctx) const
{
    const Vector2D destination =
        GridModel::cellCenter(AgentStateMachine::destinationFor(agent.state, ctx.grid));
    auto waypoints = ctx.planner->plan(agent.position, destination,
                                       AgentStateMachine::excludedLayersFor(agent.state),
                                       agent.avoidanceDelta);
    if (waypoints) {
        agent.path->replaceWaypoints(*waypoints);
        agent.path->revalidate.reset();
        agent.avoidanceDelta = m_config.baseAvoidanceDelta;
        return;
    }

    agent.avoidanceDelta *= m_config.backoffFactor;
    if (agent.avoidanceDelta > m_config.avoidanceCeiling) {
        agent.path.reset();
        agent.parked = true;
        ctx.emit(ArenaEventType::AGENT_PARKED, agent.id, agent.position);
        REPLANNER_INFO("Agent " + std::to_string(agent.id) + " unreachable, parked until the next rebuild");
        return;
    }

    agent.path->revalidate.rearm(m_config.failureCooldown);
    REPLANNER_DEBUG("Agent " + std::to_string(agent.id) + " re-validation failed, delta now " +
                    std::to_string(agent.avoidanceDelta));
}

void Replanner::update(float deltaTime, SimulationContext& ctx)
{
    if (!ctx.planner) {
        return;
    }
    for (Agent& agent : ctx.agents.getAgents()) {
        if (!agent.path || !agent.path->revalidate.tick(deltaTime)) {
            continue;
        }
        revalidate(agent, ctx);
    }
}

void Replanner::onSurfaceRebuilt(SimulationContext& ctx)
{
    for (Agent& agent : ctx.agents.getAgents()) {
        if (agent.parked) {
            agent.parked = false;
            agent.avoidanceDelta = m_config.baseAvoidanceDelta;
        }
        if (agent.path) {
            agent.path->revalidate.expireNow();
        }
    }
}

} // namespace ArenaEngine
