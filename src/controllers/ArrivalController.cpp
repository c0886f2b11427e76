/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/ArrivalController.hpp"
#include "ai/agents/AgentStateMachine.hpp"
#include "core/Logger.hpp"
#include <string>
#include <vector>

namespace ArenaEngine {

ArrivalController::ArrivalController(const ArrivalConfig& config) : m_config(config) {}

void ArrivalController::update(float /*deltaTime*/, SimulationContext& ctx)
{
    std::vector<AgentID> delivered;

    for (Agent& agent : ctx.agents.getAgents()) {
        switch (AgentStateMachine::evaluateArrival(agent, ctx.grid, m_config)) {
            case ArrivalOutcome::NONE:
                break;
            case ArrivalOutcome::REACHED_GOAL:
                ctx.emit(ArenaEventType::GOAL_REACHED, agent.id, agent.position);
                AGENTS_INFO("Agent " + std::to_string(agent.id) + " reached the goal, returning");
                break;
            case ArrivalOutcome::DELIVERED:
                ctx.emit(ArenaEventType::DELIVERED, agent.id, agent.position);
                delivered.push_back(agent.id);
                break;
        }
    }

    for (AgentID id : delivered) {
        ctx.agents.destroy(id);
        AGENTS_INFO("Agent " + std::to_string(id) + " delivered");
    }
}

} // namespace ArenaEngine
