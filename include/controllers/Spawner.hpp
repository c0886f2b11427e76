/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWNER_HPP
#define SPAWNER_HPP

#include "ai/SimulationConfig.hpp"
#include "controllers/SimulationPhase.hpp"
#include "utils/Countdown.hpp"
#include <optional>

namespace ArenaEngine {

/**
 * @brief Timer-gated creation of agents at the spawn cell.
 *
 * While the population is below the level cap a spawn countdown runs; the
 * agent appears when it expires. The first countdown after a level start
 * uses the initial delay (longer when the level shows an intro message),
 * later ones the level's spawn interval. Nothing happens at all while the
 * path status is BLOCKED.
 */
class Spawner : public SimulationPhase
{
public:
    explicit Spawner(const SpawnerConfig& config);

    void update(float deltaTime, SimulationContext& ctx) override;
    void onLevelStart(SimulationContext& ctx) override;
    const char* getName() const override { return "Spawner"; }

    [[nodiscard]] bool isTimerRunning() const { return m_timer.has_value(); }
    [[nodiscard]] float getTimeUntilSpawn() const { return m_timer ? m_timer->getRemaining() : 0.0f; }

private:
    SpawnerConfig m_config;
    std::optional<Countdown> m_timer;
    bool m_firstSpawnPending{true};

    float nextDelay(const SimulationContext& ctx) const;
};

} // namespace ArenaEngine

#endif // SPAWNER_HPP
