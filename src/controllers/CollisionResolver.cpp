/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/CollisionResolver.hpp"
#include "core/Logger.hpp"
#include <string>

namespace ArenaEngine {

void CollisionResolver::update(float /*deltaTime*/, SimulationContext& ctx)
{
    if (ctx.contacts.empty()) {
        return;
    }
    resolve(ctx.contacts, ctx);
    ctx.contacts.clear();
}

void CollisionResolver::resolve(const std::vector<Contact>& contacts, SimulationContext& ctx) const
{
    for (const Contact& contact : contacts) {
        const Agent* agent = ctx.agents.find(contact.agent);
        if (!agent) {
            continue;
        }

        switch (contact.otherKind) {
            case ContactKind::HAZARD: {
                const AgentID id = agent->id;
                const Vector2D position = agent->position;
                ctx.agents.destroy(id);
                ctx.emit(ArenaEventType::AGENT_DESTROYED_BY_HAZARD, id, position);
                COLLISION_INFO("Agent " + std::to_string(id) + " destroyed by hazard");
                break;
            }
            case ContactKind::AGENT: {
                const Agent* other = ctx.agents.find(contact.other);
                if (!other || other->id == agent->id || other->state == agent->state) {
                    break;
                }
                const Agent* victim = agent->state == AgentState::SEEKING ? agent : other;
                const Agent* survivor = victim == agent ? other : agent;
                const AgentID id = victim->id;
                [[maybe_unused]] const AgentID survivorId = survivor->id;
                const Vector2D position = victim->position;
                ctx.agents.destroy(id);
                ctx.emit(ArenaEventType::AGENT_LOST, id, position);
                COLLISION_INFO("Agent " + std::to_string(id) + " lost in collision with agent " +
                               std::to_string(survivorId));
                break;
            }
        }
    }
}

} // namespace ArenaEngine
