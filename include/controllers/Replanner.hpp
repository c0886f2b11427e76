/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REPLANNER_HPP
#define REPLANNER_HPP

#include "ai/SimulationConfig.hpp"
#include "controllers/SimulationPhase.hpp"

namespace ArenaEngine {

/**
 * @brief Periodic re-validation of assigned paths with backoff.
 *
 * Every agent with a path replans on its own revalidation countdown.
 * Success replaces the waypoints and resets the agent's avoidance delta.
 * Failure multiplies the delta by the backoff factor and retries after the
 * failure cooldown; once the delta passes the ceiling the path is dropped
 * and the agent is parked. A surface rebuild unparks every agent and makes
 * all paths re-validate on the next tick.
 */
class Replanner : public SimulationPhase
{
public:
    explicit Replanner(const ReplanConfig& config);

    void update(float deltaTime, SimulationContext& ctx) override;
    void onSurfaceRebuilt(SimulationContext& ctx) override;
    const char* getName() const override { return "Replanner"; }

    // One re-validation attempt for one agent; the agent must have a path
    void revalidate(Agent& agent, SimulationContext& ctx) const;

private:
    ReplanConfig m_config;
};

} // namespace ArenaEngine

#endif // REPLANNER_HPP
