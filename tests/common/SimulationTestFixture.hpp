/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_TEST_FIXTURE_HPP
#define SIMULATION_TEST_FIXTURE_HPP

/**
 * @file SimulationTestFixture.hpp
 * @brief Fresh SimulationContext over a test level, for driving single phases
 */

#include "ai/SimulationContext.hpp"
#include "ai/navigation/NavSurfaceBuilder.hpp"
#include "TestLevels.hpp"
#include <algorithm>

namespace ArenaTest {

struct SimulationTestFixture {
    explicit SimulationTestFixture(GridModel level = openLevel(), SimulationConfig simConfig = SimulationConfig{})
        : grid(std::move(level)), config(simConfig), builder(grid), ctx(grid, config) {
        ctx.installSurface(builder.build(excluded));
    }

    // Installs a surface for the new exclusion set, as ArenaSimulation does
    void rebuild(const ExclusionSet& cells) {
        excluded = cells;
        ctx.installSurface(builder.build(excluded));
    }

    // Runs `seconds` worth of fixed ticks through `step`
    template<typename Step>
    void runFor(float seconds, float dt, Step&& step) {
        const int ticks = static_cast<int>(seconds / dt + 0.5f);
        for (int i = 0; i < ticks; ++i) {
            step(dt);
        }
    }

    size_t countEvents(ArenaEventType type) const {
        return static_cast<size_t>(std::count_if(ctx.events.begin(), ctx.events.end(),
            [type](const ArenaEvent& e) { return e.type == type; }));
    }

    GridModel grid;
    SimulationConfig config;
    NavSurfaceBuilder builder;
    ExclusionSet excluded;
    SimulationContext ctx;
};

} // namespace ArenaTest

#endif // SIMULATION_TEST_FIXTURE_HPP
