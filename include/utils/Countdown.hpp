/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COUNTDOWN_HPP
#define COUNTDOWN_HPP

#include <algorithm>

namespace ArenaEngine {

/**
 * Simulation-clock countdown advanced once per tick.
 *
 * A repeating countdown rearms itself when it expires and carries the
 * overshoot into the next period; a one-shot countdown stays expired.
 */
class Countdown {
public:
    Countdown() = default;
    explicit Countdown(float durationSeconds, bool repeating = false)
        : m_duration(durationSeconds), m_remaining(durationSeconds), m_repeating(repeating) {}

    // Returns true if the countdown expired during this tick
    bool tick(float deltaTime) {
        if (m_fired) {
            return false;
        }
        m_remaining -= deltaTime;
        if (m_remaining > 0.0f) {
            return false;
        }
        if (m_repeating) {
            m_remaining += m_duration;
            if (m_remaining <= 0.0f) m_remaining = m_duration;
        } else {
            m_fired = true;
        }
        return true;
    }

    // Restart from the full duration
    void reset() {
        m_remaining = m_duration;
        m_fired = false;
    }

    // Next expiry after `seconds` instead of the regular duration; a
    // repeating countdown returns to its regular period after that
    void rearm(float seconds) {
        m_remaining = seconds;
        m_fired = false;
    }

    // Expire on the next tick
    void expireNow() { rearm(0.0f); }

    bool isExpired() const { return m_fired; }
    bool isRepeating() const { return m_repeating; }
    float getRemaining() const { return std::max(m_remaining, 0.0f); }
    float getDuration() const { return m_duration; }

private:
    float m_duration{0.0f};
    float m_remaining{0.0f};
    bool m_repeating{false};
    bool m_fired{false};
};

} // namespace ArenaEngine

#endif // COUNTDOWN_HPP
