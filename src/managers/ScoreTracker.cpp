/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ScoreTracker.hpp"

namespace ArenaEngine {

ScoreTracker::ScoreTracker(const LevelSettings& settings)
    : m_treasureTarget(settings.treasureTarget),
      m_lossLimit(settings.lossLimit),
      m_obstacleBudget(settings.obstacleBudget) {}

void ScoreTracker::recordEvent(const ArenaEvent& event)
{
    switch (event.type) {
        case ArenaEventType::DELIVERED:
            ++m_delivered;
            break;
        case ArenaEventType::AGENT_LOST:
        case ArenaEventType::AGENT_DESTROYED_BY_HAZARD:
            ++m_lost;
            break;
        default:
            break;
    }
}

LevelOutcome ScoreTracker::getOutcome() const
{
    if (m_delivered >= m_treasureTarget) {
        return LevelOutcome::WON;
    }
    if (m_lossLimit && m_lost > *m_lossLimit) {
        return LevelOutcome::LOST;
    }
    return LevelOutcome::IN_PROGRESS;
}

bool ScoreTracker::tryConsumeObstacle()
{
    if (m_obstaclesInUse >= m_obstacleBudget) {
        return false;
    }
    ++m_obstaclesInUse;
    return true;
}

void ScoreTracker::refundObstacle()
{
    if (m_obstaclesInUse > 0) {
        --m_obstaclesInUse;
    }
}

void ScoreTracker::reset()
{
    m_delivered = 0;
    m_lost = 0;
    m_obstaclesInUse = 0;
}

} // namespace ArenaEngine
