/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/agents/AgentRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <string>

namespace ArenaEngine {

Agent& AgentRegistry::spawn(const Vector2D& position, float orientation, float avoidanceDelta) {
    Agent agent;
    agent.id = m_nextId++;
    agent.position = position;
    agent.orientation = orientation;
    agent.avoidanceDelta = avoidanceDelta;
    m_agents.push_back(std::move(agent));
    AGENTS_DEBUG("Agent " + std::to_string(m_agents.back().id) + " created, population " +
                 std::to_string(m_agents.size()));
    return m_agents.back();
}

bool AgentRegistry::destroy(AgentID id) {
    auto it = std::find_if(m_agents.begin(), m_agents.end(),
                           [id](const Agent& a) { return a.id == id; });
    if (it == m_agents.end()) {
        return false;
    }
    m_agents.erase(it);
    AGENTS_DEBUG("Agent " + std::to_string(id) + " removed, population " + std::to_string(m_agents.size()));
    return true;
}

Agent* AgentRegistry::find(AgentID id) {
    // Ids are increasing in spawn order
    auto it = std::lower_bound(m_agents.begin(), m_agents.end(), id,
                               [](const Agent& a, AgentID value) { return a.id < value; });
    return (it != m_agents.end() && it->id == id) ? &*it : nullptr;
}

const Agent* AgentRegistry::find(AgentID id) const {
    return const_cast<AgentRegistry*>(this)->find(id);
}

} // namespace ArenaEngine
