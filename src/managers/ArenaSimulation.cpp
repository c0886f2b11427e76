/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ArenaSimulation.hpp"
#include "controllers/ArrivalController.hpp"
#include "controllers/CollisionResolver.hpp"
#include "controllers/PathAssigner.hpp"
#include "controllers/Replanner.hpp"
#include "controllers/SteeringController.hpp"
#include "controllers/Spawner.hpp"
#include "core/Logger.hpp"
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace ArenaEngine {

namespace {

const SimulationConfig& validated(const SimulationConfig& config)
{
    std::string error;
    if (!config.validate(error)) {
        SIMULATION_ERROR("Invalid simulation config: " + error);
        throw std::invalid_argument("Invalid simulation config: " + error);
    }
    return config;
}

std::string describe(const CellCoord& cell)
{
    return "(" + std::to_string(cell.col) + ", " + std::to_string(cell.row) + ")";
}

} // namespace

ArenaSimulation::ArenaSimulation(GridModel grid, const SimulationConfig& config)
    : m_grid(std::move(grid)),
      m_config(validated(config)),
      m_builder(m_grid),
      m_context(m_grid, m_config),
      m_score(m_grid.settings)
{
    m_context.installSurface(m_builder.build(m_excluded));
    registerPhases();
    m_phases.levelStartAll(m_context);

    SIMULATION_INFO("Level started: " + std::to_string(m_grid.getColumns()) + "x" +
                    std::to_string(m_grid.getRows()) + " grid, " +
                    std::to_string(getSurface().getTotalPolygonCount()) + " polygons, cap " +
                    std::to_string(m_grid.settings.populationCap));
}

void ArenaSimulation::registerPhases()
{
    m_phases.add<Spawner>(m_config.spawner);
    m_phases.add<SteeringController>(m_config.steering, m_config.arrival);
    m_phases.add<ArrivalController>(m_config.arrival);
    m_phases.add<PathAssigner>(m_config.replan);
    m_phases.add<Replanner>(m_config.replan);
    m_phases.add<CollisionResolver>();
}

void ArenaSimulation::update(float deltaTime, const std::vector<Contact>& contacts)
{
    m_context.contacts.insert(m_context.contacts.end(), contacts.begin(), contacts.end());

    const size_t firstEvent = m_context.events.size();
    m_phases.updateAll(deltaTime, m_context);
    m_context.simTime += deltaTime;
    ++m_context.tickCount;

    for (size_t i = firstEvent; i < m_context.events.size(); ++i) {
        m_score.recordEvent(m_context.events[i]);
    }

    const LevelOutcome outcome = m_score.getOutcome();
    if (outcome != m_lastOutcome) {
        m_lastOutcome = outcome;
        std::ostringstream oss;
        oss << "Level outcome: " << outcome << " (delivered " << m_score.getDelivered()
            << ", lost " << m_score.getLost() << ")";
        SIMULATION_INFO(oss.str());
    }
}

void ArenaSimulation::rebuildSurface()
{
    m_context.installSurface(m_builder.build(m_excluded));
    m_context.emit(ArenaEventType::SURFACE_REBUILT, INVALID_AGENT_ID, Vector2D());
    m_phases.surfaceRebuiltAll(m_context);
}

bool ArenaSimulation::placeObstacle(const CellCoord& cell)
{
    if (!m_grid.inBounds(cell) || m_grid.at(cell).kind != CellKind::FLOOR) {
        SIMULATION_WARN("Obstacle rejected at " + describe(cell) + ": not a floor cell");
        return false;
    }
    if (m_excluded.count(cell) > 0) {
        return false;
    }
    if (!m_score.tryConsumeObstacle()) {
        SIMULATION_INFO("Obstacle rejected at " + describe(cell) + ": budget used up");
        return false;
    }

    m_excluded.insert(cell);
    try {
        rebuildSurface();
    } catch (const std::exception& e) {
        m_excluded.erase(cell);
        m_score.refundObstacle();
        SIMULATION_ERROR("Rebuild failed after placing obstacle at " + describe(cell) + ": " + e.what());
        throw;
    }

    SIMULATION_INFO("Obstacle placed at " + describe(cell) + ", " +
                    std::to_string(m_score.getObstaclesRemaining()) + " left");
    return true;
}

bool ArenaSimulation::removeObstacle(const CellCoord& cell)
{
    if (m_excluded.erase(cell) == 0) {
        return false;
    }
    try {
        rebuildSurface();
    } catch (const std::exception& e) {
        m_excluded.insert(cell);
        SIMULATION_ERROR("Rebuild failed after removing obstacle at " + describe(cell) + ": " + e.what());
        throw;
    }
    m_score.refundObstacle();

    SIMULATION_INFO("Obstacle removed at " + describe(cell));
    return true;
}

void ArenaSimulation::restartLevel()
{
    m_context.agents.clear();
    m_context.events.clear();
    m_context.contacts.clear();
    m_context.simTime = 0.0;
    m_context.tickCount = 0;
    m_excluded.clear();
    m_score.reset();
    m_lastOutcome = LevelOutcome::IN_PROGRESS;

    m_context.installSurface(m_builder.build(m_excluded));
    m_phases.levelStartAll(m_context);
    SIMULATION_INFO("Level restarted");
}

std::vector<AgentSnapshot> ArenaSimulation::getSnapshots(bool includeWaypoints) const
{
    std::vector<AgentSnapshot> snapshots;
    snapshots.reserve(m_context.agents.size());
    for (const Agent& agent : m_context.agents.getAgents()) {
        AgentSnapshot snapshot;
        snapshot.id = agent.id;
        snapshot.position = agent.position;
        snapshot.orientation = agent.orientation;
        snapshot.state = agent.state;
        snapshot.parked = agent.parked;
        if (includeWaypoints && agent.path) {
            snapshot.waypoints = agent.path->toWaypoints();
        }
        snapshots.push_back(std::move(snapshot));
    }
    return snapshots;
}

std::string ArenaSimulation::getSummary() const
{
    std::ostringstream oss;
    oss << getOutcome() << " after " << m_context.simTime << "s: delivered "
        << m_score.getDelivered() << "/" << m_grid.settings.treasureTarget << ", lost "
        << m_score.getLost();
    if (m_grid.settings.lossLimit) {
        oss << " (limit " << *m_grid.settings.lossLimit << ")";
    }
    return oss.str();
}

std::vector<ArenaEvent> ArenaSimulation::drainEvents()
{
    std::vector<ArenaEvent> drained;
    drained.swap(m_context.events);
    return drained;
}

} // namespace ArenaEngine
