/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARENA_EVENTS_HPP
#define ARENA_EVENTS_HPP

#include <cstdint>
#include <ostream>
#include "ai/agents/Agent.hpp"
#include "utils/Vector2D.hpp"

namespace ArenaEngine {

/**
 * Discrete simulation events handed to presentation and scoring.
 */
enum class ArenaEventType : uint8_t {
    AGENT_SPAWNED,
    GOAL_REACHED,              // Seeking agent picked up treasure (idle effect)
    DELIVERED,                 // Returning agent made it home; scores
    AGENT_LOST,                // Destroyed in an agent-agent contact
    AGENT_DESTROYED_BY_HAZARD,
    AGENT_PARKED,              // Gave up replanning until the next rebuild
    PATH_STATUS_CHANGED,
    SURFACE_REBUILT
};

inline std::ostream& operator<<(std::ostream& os, const ArenaEventType& type) {
    switch (type) {
        case ArenaEventType::AGENT_SPAWNED: return os << "AGENT_SPAWNED";
        case ArenaEventType::GOAL_REACHED: return os << "GOAL_REACHED";
        case ArenaEventType::DELIVERED: return os << "DELIVERED";
        case ArenaEventType::AGENT_LOST: return os << "AGENT_LOST";
        case ArenaEventType::AGENT_DESTROYED_BY_HAZARD: return os << "AGENT_DESTROYED_BY_HAZARD";
        case ArenaEventType::AGENT_PARKED: return os << "AGENT_PARKED";
        case ArenaEventType::PATH_STATUS_CHANGED: return os << "PATH_STATUS_CHANGED";
        case ArenaEventType::SURFACE_REBUILT: return os << "SURFACE_REBUILT";
        default: return os << "UNKNOWN";
    }
}

struct ArenaEvent {
    ArenaEventType type;
    AgentID agent = INVALID_AGENT_ID;   // INVALID_AGENT_ID for level-wide events
    Vector2D position;
};

} // namespace ArenaEngine

#endif // ARENA_EVENTS_HPP
