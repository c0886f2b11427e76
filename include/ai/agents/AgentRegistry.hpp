/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_REGISTRY_HPP
#define AGENT_REGISTRY_HPP

#include <cstddef>
#include <vector>
#include "ai/agents/Agent.hpp"

namespace ArenaEngine {

/**
 * @brief Live agents in spawn order.
 *
 * Iteration order is creation order, which keeps every phase deterministic.
 * Ids are never reused within a registry's lifetime.
 */
class AgentRegistry {
public:
    AgentRegistry() = default;

    Agent& spawn(const Vector2D& position, float orientation, float avoidanceDelta);

    // Removes the agent; false if the id is unknown
    bool destroy(AgentID id);

    Agent* find(AgentID id);
    const Agent* find(AgentID id) const;

    std::vector<Agent>& getAgents() { return m_agents; }
    const std::vector<Agent>& getAgents() const { return m_agents; }

    size_t size() const { return m_agents.size(); }
    bool empty() const { return m_agents.empty(); }

    void clear() { m_agents.clear(); }

private:
    std::vector<Agent> m_agents;
    AgentID m_nextId{1};
};

} // namespace ArenaEngine

#endif // AGENT_REGISTRY_HPP
