/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_HPP
#define AGENT_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>
#include "utils/Countdown.hpp"
#include "utils/Vector2D.hpp"

namespace ArenaEngine {

using AgentID = uint32_t;
constexpr AgentID INVALID_AGENT_ID = 0;

enum class AgentState : uint8_t {
    SEEKING,    // Outbound to the goal cell
    RETURNING   // Carrying treasure back to the spawn cell
};

inline std::ostream& operator<<(std::ostream& os, const AgentState& state) {
    switch (state) {
        case AgentState::SEEKING: return os << "SEEKING";
        case AgentState::RETURNING: return os << "RETURNING";
        default: return os << "UNKNOWN";
    }
}

/**
 * Current waypoint plus the rest of the path, stored reversed so the next
 * waypoint after `next` is remaining.back().
 */
struct PathAssignment {
    Vector2D next;
    std::vector<Vector2D> remaining;
    Countdown revalidate;

    /**
     * Builds an assignment from planner output. The leading point (the
     * agent's own position) is skipped when the path has more than one point.
     */
    static PathAssignment fromWaypoints(const std::vector<Vector2D>& waypoints, float revalidateInterval);

    // Replace the waypoints, keeping the revalidation countdown
    void replaceWaypoints(const std::vector<Vector2D>& waypoints);

    bool isFinalWaypoint() const { return remaining.empty(); }

    // Moves to the following waypoint; false if `next` is the last one
    bool advance();

    // next followed by the remaining waypoints in travel order
    std::vector<Vector2D> toWaypoints() const;
};

struct Agent {
    AgentID id = INVALID_AGENT_ID;
    Vector2D position;
    Vector2D velocity;
    float orientation = 0.0f;           // Radians, heading derived from velocity
    AgentState state = AgentState::SEEKING;
    std::optional<PathAssignment> path;
    float avoidanceDelta = 0.1f;        // Widened on each failed re-validation
    bool parked = false;                // Gave up on planning until the next surface rebuild
};

} // namespace ArenaEngine

#endif // AGENT_HPP
