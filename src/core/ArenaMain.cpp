/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include "managers/ArenaSimulation.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

using namespace ArenaEngine;

namespace {

const std::string APP_NAME{"ArenaSim"};
constexpr float UPDATE_HZ{60.0f};
constexpr double DEFAULT_TIME_LIMIT{120.0};

// Built-in demo level: two interior holes, one portal of each kind
GridModel makeDemoLevel() {
  LevelSettings settings;
  settings.populationCap = 4;
  settings.spawnIntervalSeconds = 2.0f;
  settings.goalText = "Deliver 5 treasures";
  settings.treasureTarget = 5;
  settings.lossLimit = 3;
  settings.obstacleBudget = 2;

  return GridModel::fromRows({
      "S#########",
      "##########",
      "###.##I###",
      "##########",
      "######.###",
      "#O#######G",
  }, settings);
}

// Scripted obstacle placement so the demo exercises surface rebuilds
struct ScriptedObstacle {
  double atSeconds;
  CellCoord cell;
  bool place;
};

std::string describeEvent(const ArenaEvent& event) {
  std::ostringstream oss;
  oss << event.type;
  if (event.agent != INVALID_AGENT_ID) {
    oss << " agent " << event.agent << " at " << event.position;
  }
  return oss.str();
}

} // namespace

int main(int argc, char* argv[]) {
  bool realtime = true;
  double timeLimit = DEFAULT_TIME_LIMIT;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--fast") == 0) {
      realtime = false;
    } else if (std::strcmp(argv[i], "--seconds") == 0 && i + 1 < argc) {
      timeLimit = std::atof(argv[++i]);
    } else {
      RUNNER_WARN("Ignoring unknown argument: " + std::string(argv[i]));
    }
  }

  if (!SDL_Init(0)) {
    RUNNER_CRITICAL("SDL_Init failed: " + std::string(SDL_GetError()));
    return -1;
  }

  RUNNER_INFO("Initializing " + APP_NAME);

  int exitCode = 0;
  try {
    ArenaSimulation sim(makeDemoLevel());
    TimestepManager ts(UPDATE_HZ, realtime);

    std::vector<ScriptedObstacle> script{
        {10.0, CellCoord{5, 1}, true},
        {10.0, CellCoord{5, 3}, true},
        {25.0, CellCoord{5, 1}, false},
    };
    size_t nextScripted = 0;

    RUNNER_INFO(std::string("Running at ") + std::to_string(static_cast<int>(UPDATE_HZ)) + " Hz, " +
                (realtime ? "realtime" : "fast-forward") + ", limit " +
                std::to_string(static_cast<int>(timeLimit)) + "s");

    while (sim.getOutcome() == LevelOutcome::IN_PROGRESS && sim.getSimulationTime() < timeLimit) {
      ts.startFrame();

      while (ts.shouldUpdate()) {
        while (nextScripted < script.size() && sim.getSimulationTime() >= script[nextScripted].atSeconds) {
          const ScriptedObstacle& step = script[nextScripted++];
          const bool applied = step.place ? sim.placeObstacle(step.cell) : sim.removeObstacle(step.cell);
          if (!applied) {
            RUNNER_WARN("Scripted obstacle change was rejected");
          }
        }

        sim.update(ts.getUpdateDeltaTime());

        for (const ArenaEvent& event : sim.drainEvents()) {
          RUNNER_INFO(describeEvent(event));
        }
      }

      ts.endFrame();
    }

    // The result is the runner's output, printed in every build type
    const std::string summary = sim.getSummary();
    std::printf("%s: %s (%llu updates)\n", APP_NAME.c_str(), summary.c_str(),
                static_cast<unsigned long long>(ts.getUpdateCount()));
    std::fflush(stdout);
    RUNNER_INFO("Finished: " + summary);
  } catch (const std::exception& e) {
    RUNNER_CRITICAL("Simulation aborted: " + std::string(e.what()));
    exitCode = -1;
  }

  SDL_Quit();
  return exitCode;
}
