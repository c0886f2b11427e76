/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVER_HPP
#define COLLISION_RESOLVER_HPP

#include "controllers/SimulationPhase.hpp"
#include <vector>

namespace ArenaEngine {

/**
 * @brief Lifecycle policy for contacts reported by physics.
 *
 * Hazard contact destroys the agent (AGENT_DESTROYED_BY_HAZARD). Contact
 * between agents in different states destroys the SEEKING one
 * (AGENT_LOST); same-state contact is ignored. Contacts naming an agent
 * that is already gone, including one removed earlier in the same feed,
 * are skipped.
 */
class CollisionResolver : public SimulationPhase
{
public:
    CollisionResolver() = default;

    // Resolves and clears ctx.contacts
    void update(float deltaTime, SimulationContext& ctx) override;
    const char* getName() const override { return "CollisionResolver"; }

    void resolve(const std::vector<Contact>& contacts, SimulationContext& ctx) const;
};

} // namespace ArenaEngine

#endif // COLLISION_RESOLVER_HPP
