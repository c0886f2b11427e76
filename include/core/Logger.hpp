/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - std::atomic<bool> benchmark flag
#include <cstdint> // IWYU pragma: keep - uint8_t
#include <cstdio> // IWYU pragma: keep - printf() and fflush()
#include <mutex> // IWYU pragma: keep - serialized console output
#include <string> // IWYU pragma: keep - std::string messages built in macros

namespace ArenaEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (file sink in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

inline const char *toLevelString(LogLevel level) {
  switch (level) {
  case LogLevel::CRITICAL:
    return "CRITICAL";
  case LogLevel::ERROR_LEVEL:
    return "ERROR";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::DEBUG_LEVEL:
    return "DEBUG";
  }
  return "UNKNOWN";
}

class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

#ifdef DEBUG
  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("ArenaSim - [%s] %s: %s\n", system, toLevelString(level), message);
    fflush(stdout);
  }
#else
  // Release builds write to a rotating log file (see Logger.cpp)
  static void Log(LogLevel level, const char *system,
                  const std::string &message);
  static void Log(LogLevel level, const char *system, const char *message);
#endif
};

#define ARENA_CRITICAL(system, msg)                                            \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::CRITICAL, system, msg)
#define ARENA_ERROR(system, msg)                                               \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define ARENA_WARN(system, msg)                                                \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::WARNING, system, msg)
#define ARENA_INFO(system, msg)                                                \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::INFO, system, msg)
#define ARENA_DEBUG(system, msg)                                               \
  ArenaEngine::Logger::Log(ArenaEngine::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define ARENA_WARN(system, msg) ((void)0)  // Zero overhead
#define ARENA_INFO(system, msg) ((void)0)  // Zero overhead
#define ARENA_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Per-system convenience macros

// Level data
#define GRID_CRITICAL(msg) ARENA_CRITICAL("GridModel", msg)
#define GRID_ERROR(msg) ARENA_ERROR("GridModel", msg)
#define GRID_WARN(msg) ARENA_WARN("GridModel", msg)
#define GRID_INFO(msg) ARENA_INFO("GridModel", msg)
#define GRID_DEBUG(msg) ARENA_DEBUG("GridModel", msg)

// Navigation
#define NAVSURFACE_CRITICAL(msg) ARENA_CRITICAL("NavSurface", msg)
#define NAVSURFACE_ERROR(msg) ARENA_ERROR("NavSurface", msg)
#define NAVSURFACE_WARN(msg) ARENA_WARN("NavSurface", msg)
#define NAVSURFACE_INFO(msg) ARENA_INFO("NavSurface", msg)
#define NAVSURFACE_DEBUG(msg) ARENA_DEBUG("NavSurface", msg)

#define PLANNER_CRITICAL(msg) ARENA_CRITICAL("PathPlanner", msg)
#define PLANNER_ERROR(msg) ARENA_ERROR("PathPlanner", msg)
#define PLANNER_WARN(msg) ARENA_WARN("PathPlanner", msg)
#define PLANNER_INFO(msg) ARENA_INFO("PathPlanner", msg)
#define PLANNER_DEBUG(msg) ARENA_DEBUG("PathPlanner", msg)

// Agent systems
#define AGENTS_CRITICAL(msg) ARENA_CRITICAL("AgentRegistry", msg)
#define AGENTS_ERROR(msg) ARENA_ERROR("AgentRegistry", msg)
#define AGENTS_WARN(msg) ARENA_WARN("AgentRegistry", msg)
#define AGENTS_INFO(msg) ARENA_INFO("AgentRegistry", msg)
#define AGENTS_DEBUG(msg) ARENA_DEBUG("AgentRegistry", msg)

#define SPAWNER_CRITICAL(msg) ARENA_CRITICAL("Spawner", msg)
#define SPAWNER_ERROR(msg) ARENA_ERROR("Spawner", msg)
#define SPAWNER_WARN(msg) ARENA_WARN("Spawner", msg)
#define SPAWNER_INFO(msg) ARENA_INFO("Spawner", msg)
#define SPAWNER_DEBUG(msg) ARENA_DEBUG("Spawner", msg)

#define STEERING_CRITICAL(msg) ARENA_CRITICAL("Steering", msg)
#define STEERING_ERROR(msg) ARENA_ERROR("Steering", msg)
#define STEERING_WARN(msg) ARENA_WARN("Steering", msg)
#define STEERING_INFO(msg) ARENA_INFO("Steering", msg)
#define STEERING_DEBUG(msg) ARENA_DEBUG("Steering", msg)

#define REPLANNER_CRITICAL(msg) ARENA_CRITICAL("Replanner", msg)
#define REPLANNER_ERROR(msg) ARENA_ERROR("Replanner", msg)
#define REPLANNER_WARN(msg) ARENA_WARN("Replanner", msg)
#define REPLANNER_INFO(msg) ARENA_INFO("Replanner", msg)
#define REPLANNER_DEBUG(msg) ARENA_DEBUG("Replanner", msg)

#define COLLISION_CRITICAL(msg) ARENA_CRITICAL("CollisionResolver", msg)
#define COLLISION_ERROR(msg) ARENA_ERROR("CollisionResolver", msg)
#define COLLISION_WARN(msg) ARENA_WARN("CollisionResolver", msg)
#define COLLISION_INFO(msg) ARENA_INFO("CollisionResolver", msg)
#define COLLISION_DEBUG(msg) ARENA_DEBUG("CollisionResolver", msg)

// Orchestration
#define SIMULATION_CRITICAL(msg) ARENA_CRITICAL("ArenaSimulation", msg)
#define SIMULATION_ERROR(msg) ARENA_ERROR("ArenaSimulation", msg)
#define SIMULATION_WARN(msg) ARENA_WARN("ArenaSimulation", msg)
#define SIMULATION_INFO(msg) ARENA_INFO("ArenaSimulation", msg)
#define SIMULATION_DEBUG(msg) ARENA_DEBUG("ArenaSimulation", msg)

#define RUNNER_CRITICAL(msg) ARENA_CRITICAL("Runner", msg)
#define RUNNER_ERROR(msg) ARENA_ERROR("Runner", msg)
#define RUNNER_WARN(msg) ARENA_WARN("Runner", msg)
#define RUNNER_INFO(msg) ARENA_INFO("Runner", msg)
#define RUNNER_DEBUG(msg) ARENA_DEBUG("Runner", msg)

// Benchmark mode convenience macros
#define ARENA_ENABLE_BENCHMARK_MODE()                                          \
  ArenaEngine::Logger::SetBenchmarkMode(true)
#define ARENA_DISABLE_BENCHMARK_MODE()                                         \
  ArenaEngine::Logger::SetBenchmarkMode(false)

} // namespace ArenaEngine

#endif // LOGGER_HPP
