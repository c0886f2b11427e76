/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_PHASE_HPP
#define SIMULATION_PHASE_HPP

/**
 * @file SimulationPhase.hpp
 * @brief Base class for the fixed-order phases of a simulation tick
 *
 * A phase owns only its own timers; everything shared between phases lives
 * in the SimulationContext passed to each call.
 *
 * Tick order (set by ArenaSimulation):
 * Spawner, SteeringController, ArrivalController, PathAssigner, Replanner,
 * CollisionResolver
 */

#include "ai/SimulationContext.hpp"

namespace ArenaEngine {

class SimulationPhase
{
public:
    SimulationPhase() = default;
    virtual ~SimulationPhase() = default;

    SimulationPhase(const SimulationPhase&) = delete;
    SimulationPhase& operator=(const SimulationPhase&) = delete;

    /**
     * @brief Runs the phase to completion for one tick
     * @param deltaTime Simulation seconds covered by this tick
     */
    virtual void update(float deltaTime, SimulationContext& ctx) = 0;

    /**
     * @brief Level (re)started: drop timers tied to the previous run
     */
    virtual void onLevelStart(SimulationContext& /*ctx*/) {}

    /**
     * @brief A new navigation surface was installed
     */
    virtual void onSurfaceRebuilt(SimulationContext& /*ctx*/) {}

    [[nodiscard]] virtual const char* getName() const = 0;
};

} // namespace ArenaEngine

#endif // SIMULATION_PHASE_HPP
