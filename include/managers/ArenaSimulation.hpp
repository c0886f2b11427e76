/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARENA_SIMULATION_HPP
#define ARENA_SIMULATION_HPP

/**
 * @file ArenaSimulation.hpp
 * @brief One running level: grid, active surface, agents and tick phases
 *
 * Owns the Grid Model, the Exclusion Set and the SimulationContext, and
 * drives the phases in fixed order once per tick. Obstacle placement and
 * removal rebuild the navigation surface synchronously, so any planning
 * query after the call sees the new Exclusion Set.
 *
 * @code
 * ArenaSimulation sim(GridModel::fromRows({"S..", "..G"}, settings));
 * sim.update(1.0f / 60.0f, contacts);
 * for (const ArenaEvent& event : sim.drainEvents()) { ... }
 * @endcode
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "ai/SimulationConfig.hpp"
#include "ai/SimulationContext.hpp"
#include "ai/navigation/NavSurfaceBuilder.hpp"
#include "controllers/PhaseRegistry.hpp"
#include "managers/ScoreTracker.hpp"
#include "world/GridModel.hpp"

namespace ArenaEngine {

// Per-tick agent view for rendering
struct AgentSnapshot {
    AgentID id = INVALID_AGENT_ID;
    Vector2D position;
    float orientation = 0.0f;
    AgentState state = AgentState::SEEKING;
    bool parked = false;
    std::vector<Vector2D> waypoints;   // Filled only for debug path snapshots
};

class ArenaSimulation {
public:
    /**
     * @brief Builds the initial surface and starts the level
     * @throws std::invalid_argument if the config or the grid does not validate
     * @throws DegenerateTopologyError if the layout has an unsupported corner
     */
    explicit ArenaSimulation(GridModel grid, const SimulationConfig& config = SimulationConfig{});

    ArenaSimulation(const ArenaSimulation&) = delete;
    ArenaSimulation& operator=(const ArenaSimulation&) = delete;

    /**
     * @brief Runs one tick
     * @param deltaTime Simulation seconds covered by the tick
     * @param contacts Overlaps reported by physics for this tick
     */
    void update(float deltaTime, const std::vector<Contact>& contacts = {});

    /**
     * @brief Blocks a floor cell and rebuilds the surface
     * @return false if the cell is not floor, is already blocked, or the
     *         obstacle budget is used up
     */
    bool placeObstacle(const CellCoord& cell);

    // Unblocks a cell and rebuilds the surface; false if it was not blocked
    bool removeObstacle(const CellCoord& cell);

    /**
     * @brief Back to the level's initial state: no agents, no obstacles,
     * empty scoreboard, fresh spawn timers
     */
    void restartLevel();

    std::vector<AgentSnapshot> getSnapshots(bool includeWaypoints = false) const;

    // One-line report: outcome, simulated time, deliveries and losses
    std::string getSummary() const;
    std::vector<ArenaEvent> drainEvents();

    PathStatus getPathStatus() const { return m_context.pathStatus; }
    LevelOutcome getOutcome() const { return m_score.getOutcome(); }
    const ExclusionSet& getExclusionSet() const { return m_excluded; }
    const NavigationSurface& getSurface() const { return m_context.planner->getSurface(); }
    PathPlanner& getPlanner() { return *m_context.planner; }
    const GridModel& getGrid() const { return m_grid; }
    const ScoreTracker& getScore() const { return m_score; }
    SimulationContext& getContext() { return m_context; }
    PhaseRegistry& getPhases() { return m_phases; }
    double getSimulationTime() const { return m_context.simTime; }
    uint64_t getTickCount() const { return m_context.tickCount; }

private:
    GridModel m_grid;
    SimulationConfig m_config;
    NavSurfaceBuilder m_builder;
    SimulationContext m_context;
    ExclusionSet m_excluded;
    PhaseRegistry m_phases;
    ScoreTracker m_score;
    LevelOutcome m_lastOutcome{LevelOutcome::IN_PROGRESS};

    void registerPhases();

    // Builds from the current Exclusion Set and swaps the surface in
    void rebuildSurface();
};

} // namespace ArenaEngine

#endif // ARENA_SIMULATION_HPP
