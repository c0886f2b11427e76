/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARRIVAL_CONTROLLER_HPP
#define ARRIVAL_CONTROLLER_HPP

#include "ai/SimulationConfig.hpp"
#include "controllers/SimulationPhase.hpp"

namespace ArenaEngine {

/**
 * @brief Applies lifecycle transitions for agents on their final waypoint.
 *
 * Emits GOAL_REACHED when a seeking agent turns back and DELIVERED when a
 * returning agent reaches home, removing the delivered agent.
 */
class ArrivalController : public SimulationPhase
{
public:
    explicit ArrivalController(const ArrivalConfig& config);

    void update(float deltaTime, SimulationContext& ctx) override;
    const char* getName() const override { return "ArrivalController"; }

private:
    ArrivalConfig m_config;
};

} // namespace ArenaEngine

#endif // ARRIVAL_CONTROLLER_HPP
