/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/agents/Agent.hpp"

namespace ArenaEngine {

PathAssignment PathAssignment::fromWaypoints(const std::vector<Vector2D>& waypoints, float revalidateInterval) {
    PathAssignment assignment;
    assignment.revalidate = Countdown(revalidateInterval, true);
    assignment.replaceWaypoints(waypoints);
    return assignment;
}

void PathAssignment::replaceWaypoints(const std::vector<Vector2D>& waypoints) {
    remaining.clear();
    if (waypoints.empty()) {
        return;
    }
    const size_t first = waypoints.size() > 1 ? 1 : 0;
    next = waypoints[first];
    remaining.assign(waypoints.rbegin(), waypoints.rend() - static_cast<std::ptrdiff_t>(first + 1));
}

bool PathAssignment::advance() {
    if (remaining.empty()) {
        return false;
    }
    next = remaining.back();
    remaining.pop_back();
    return true;
}

std::vector<Vector2D> PathAssignment::toWaypoints() const {
    std::vector<Vector2D> waypoints;
    waypoints.reserve(remaining.size() + 1);
    waypoints.push_back(next);
    waypoints.insert(waypoints.end(), remaining.rbegin(), remaining.rend());
    return waypoints;
}

} // namespace ArenaEngine
