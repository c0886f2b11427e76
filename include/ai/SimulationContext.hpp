/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CONTEXT_HPP
#define SIMULATION_CONTEXT_HPP

#include <cstdint>
#include <memory>
#include <ostream>
#include <vector>
#include "ai/SimulationConfig.hpp"
#include "ai/agents/AgentRegistry.hpp"
#include "ai/navigation/PathPlanner.hpp"
#include "events/ArenaEvents.hpp"
#include "world/GridModel.hpp"

namespace ArenaEngine {

enum class PathStatus : uint8_t {
    OPEN,
    BLOCKED   // Last path request for an idle agent failed; spawning is suspended
};

inline std::ostream& operator<<(std::ostream& os, const PathStatus& status) {
    switch (status) {
        case PathStatus::OPEN: return os << "OPEN";
        case PathStatus::BLOCKED: return os << "BLOCKED";
        default: return os << "UNKNOWN";
    }
}

enum class ContactKind : uint8_t {
    AGENT,
    HAZARD
};

// One overlap reported by the physics collaborator
struct Contact {
    AgentID agent = INVALID_AGENT_ID;
    ContactKind otherKind = ContactKind::AGENT;
    AgentID other = INVALID_AGENT_ID;   // Set for AGENT contacts
};

/**
 * Mutable session state shared by the tick phases. Tests build a fresh one
 * per case.
 */
struct SimulationContext {
    SimulationContext(const GridModel& levelGrid, const SimulationConfig& simConfig)
        : grid(levelGrid), config(simConfig) {}

    SimulationContext(const SimulationContext&) = delete;
    SimulationContext& operator=(const SimulationContext&) = delete;

    const GridModel& grid;
    const SimulationConfig& config;

    AgentRegistry agents;
    std::unique_ptr<PathPlanner> planner;   // Planner over the active surface
    PathStatus pathStatus{PathStatus::OPEN};
    std::vector<ArenaEvent> events;         // Drained by the owner each tick
    std::vector<Contact> contacts;          // Contact feed for the current tick
    double simTime{0.0};
    uint64_t tickCount{0};

    // Replaces the active surface; the previous planner and surface are released
    void installSurface(std::shared_ptr<const NavigationSurface> surface) {
        planner = std::make_unique<PathPlanner>(std::move(surface), config.planner);
    }

    void emit(ArenaEventType type, AgentID agent, const Vector2D& position) {
        events.push_back(ArenaEvent{type, agent, position});
    }

    void setPathStatus(PathStatus status) {
        if (pathStatus != status) {
            pathStatus = status;
            emit(ArenaEventType::PATH_STATUS_CHANGED, INVALID_AGENT_ID, Vector2D());
        }
    }
};

} // namespace ArenaEngine

#endif // SIMULATION_CONTEXT_HPP
