/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCORE_TRACKER_HPP
#define SCORE_TRACKER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include "events/ArenaEvents.hpp"
#include "world/GridModel.hpp"

namespace ArenaEngine {

enum class LevelOutcome : uint8_t {
    IN_PROGRESS,
    WON,    // Deliveries reached the treasure target
    LOST    // Losses went past the loss limit
};

inline std::ostream& operator<<(std::ostream& os, const LevelOutcome& outcome) {
    switch (outcome) {
        case LevelOutcome::IN_PROGRESS: return os << "IN_PROGRESS";
        case LevelOutcome::WON: return os << "WON";
        case LevelOutcome::LOST: return os << "LOST";
        default: return os << "UNKNOWN";
    }
}

/**
 * @brief Level scoreboard and obstacle budget.
 *
 * Fed with the simulation's events; deliveries count toward the treasure
 * target, agent losses and hazard kills count toward the loss limit.
 */
class ScoreTracker {
public:
    explicit ScoreTracker(const LevelSettings& settings);

    // Ignores events that do not affect the score
    void recordEvent(const ArenaEvent& event);

    uint32_t getDelivered() const { return m_delivered; }
    uint32_t getLost() const { return m_lost; }
    LevelOutcome getOutcome() const;

    // Takes one unit of the obstacle budget; false if none is left
    bool tryConsumeObstacle();
    void refundObstacle();
    uint32_t getObstaclesRemaining() const { return m_obstacleBudget - m_obstaclesInUse; }
    uint32_t getObstaclesInUse() const { return m_obstaclesInUse; }

    void reset();

private:
    uint32_t m_treasureTarget;
    std::optional<uint32_t> m_lossLimit;
    uint32_t m_obstacleBudget;

    uint32_t m_delivered{0};
    uint32_t m_lost{0};
    uint32_t m_obstaclesInUse{0};
};

} // namespace ArenaEngine

#endif // SCORE_TRACKER_HPP
