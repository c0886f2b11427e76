/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/Spawner.hpp"
#include "core/Logger.hpp"
#include <string>

namespace ArenaEngine {

Spawner::Spawner(const SpawnerConfig& config) : m_config(config) {}

void Spawner::onLevelStart(SimulationContext& ctx)
{
    m_timer.reset();
    m_firstSpawnPending = true;
    ctx.setPathStatus(PathStatus::OPEN);
}

float Spawner::nextDelay(const SimulationContext& ctx) const
{
    if (!m_firstSpawnPending) {
        return ctx.grid.settings.spawnIntervalSeconds;
    }
    return ctx.grid.settings.introMessage ? m_config.initialDelayWithMessage : m_config.initialDelay;
}

void Spawner::update(float deltaTime, SimulationContext& ctx)
{
    if (ctx.pathStatus == PathStatus::BLOCKED) {
        return;
    }

    const size_t cap = ctx.grid.settings.populationCap;

    if (m_timer) {
        if (!m_timer->tick(deltaTime)) {
            return;
        }
        m_timer.reset();
        if (ctx.agents.size() >= cap) {
            return;
        }

        const Vector2D origin = ctx.grid.spawnCenter();
        const Agent& agent = ctx.agents.spawn(origin, 0.0f, ctx.config.replan.baseAvoidanceDelta);
        ctx.emit(ArenaEventType::AGENT_SPAWNED, agent.id, origin);
        SPAWNER_INFO("Spawned agent " + std::to_string(agent.id) + " (" +
                     std::to_string(ctx.agents.size()) + "/" + std::to_string(cap) + ")");
        return;
    }

    if (ctx.agents.size() < cap) {
        float delay = nextDelay(ctx);
        m_firstSpawnPending = false;
        m_timer.emplace(delay);
        SPAWNER_DEBUG("Next spawn in " + std::to_string(delay) + "s");
    }
}

} // namespace ArenaEngine
