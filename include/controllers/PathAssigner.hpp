/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_ASSIGNER_HPP
#define PATH_ASSIGNER_HPP

#include "ai/SimulationConfig.hpp"
#include "controllers/SimulationPhase.hpp"
#include "utils/Countdown.hpp"
#include <optional>

namespace ArenaEngine {

/**
 * @brief Gives a path to every agent that has none.
 *
 * Agents plan toward the goal cell (SEEKING) or the spawn cell (RETURNING)
 * with the layer restrictions of their state. A failed request marks the
 * level BLOCKED and starts a shared cooldown during which no agent asks
 * again; a successful one marks it OPEN. Parked agents are skipped. A
 * BLOCKED level with no idle agent left to retry is reopened.
 */
class PathAssigner : public SimulationPhase
{
public:
    explicit PathAssigner(const ReplanConfig& config);

    void update(float deltaTime, SimulationContext& ctx) override;
    void onLevelStart(SimulationContext& ctx) override;
    void onSurfaceRebuilt(SimulationContext& ctx) override;
    const char* getName() const override { return "PathAssigner"; }

    [[nodiscard]] bool isCoolingDown() const { return m_cooldown.has_value(); }

private:
    ReplanConfig m_config;
    std::optional<Countdown> m_cooldown;
};

} // namespace ArenaEngine

#endif // PATH_ASSIGNER_HPP
