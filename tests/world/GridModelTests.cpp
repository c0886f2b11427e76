/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GridModelTests
#include <boost/test/unit_test.hpp>

#include "world/GridModel.hpp"
#include "ai/navigation/NavSurfaceBuilder.hpp"
#include "../common/TestLevels.hpp"
#include <stdexcept>

using namespace ArenaEngine;
using namespace ArenaTest;

BOOST_AUTO_TEST_SUITE(GridModelConstructionTests)

BOOST_AUTO_TEST_CASE(TestFromRowsFindsSpawnAndGoal)
{
    GridModel grid = openLevel();

    BOOST_CHECK_EQUAL(grid.getRows(), 5);
    BOOST_CHECK_EQUAL(grid.getColumns(), 5);
    BOOST_CHECK(grid.spawnCell == (CellCoord{0, 0}));
    BOOST_CHECK(grid.goalCell == (CellCoord{4, 4}));
    BOOST_CHECK(grid.at({0, 0}).kind == CellKind::SPAWN);
    BOOST_CHECK(grid.at({4, 4}).kind == CellKind::GOAL);
    BOOST_CHECK(grid.at({2, 2}).kind == CellKind::FLOOR);
}

BOOST_AUTO_TEST_CASE(TestSymbolMapping)
{
    GridModel grid = GridModel::fromRows({"S.IO#G"}, makeSettings());

    BOOST_CHECK(grid.at({1, 0}).isEmpty());
    BOOST_CHECK(grid.at({2, 0}).kind == CellKind::PORTAL_IN);
    BOOST_CHECK(grid.at({3, 0}).kind == CellKind::PORTAL_OUT);
    BOOST_CHECK(grid.at({2, 0}).isPortal());
    BOOST_CHECK(!grid.at({4, 0}).isPortal());
}

BOOST_AUTO_TEST_CASE(TestInvalidLayoutsThrow)
{
    BOOST_CHECK_THROW(GridModel::fromRows({}, makeSettings()), std::invalid_argument);
    BOOST_CHECK_THROW(GridModel::fromRows({"S##", "#G"}, makeSettings()), std::invalid_argument);
    BOOST_CHECK_THROW(GridModel::fromRows({"###", "##G"}, makeSettings()), std::invalid_argument);
    BOOST_CHECK_THROW(GridModel::fromRows({"S##", "S#G"}, makeSettings()), std::invalid_argument);
    BOOST_CHECK_THROW(GridModel::fromRows({"SG#", "##G"}, makeSettings()), std::invalid_argument);
    BOOST_CHECK_THROW(GridModel::fromRows({"S?G"}, makeSettings()), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestSettingsAreKept)
{
    LevelSettings settings = makeSettings(4, 2.5f);
    settings.introMessage = "Welcome";
    settings.lossLimit = 2;

    GridModel grid = shortCorridor(settings);

    BOOST_CHECK_EQUAL(grid.settings.populationCap, 4u);
    BOOST_CHECK_CLOSE(grid.settings.spawnIntervalSeconds, 2.5f, 0.001f);
    BOOST_REQUIRE(grid.settings.introMessage.has_value());
    BOOST_CHECK_EQUAL(*grid.settings.introMessage, "Welcome");
    BOOST_REQUIRE(grid.settings.lossLimit.has_value());
    BOOST_CHECK_EQUAL(*grid.settings.lossLimit, 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(OccupancyMaskTests)

BOOST_AUTO_TEST_CASE(TestInteriorCellOfOpenFloorIsFull)
{
    GridModel grid = openLevel();
    BOOST_CHECK_EQUAL(grid.maskAt({2, 2}), 0x1FF);
}

BOOST_AUTO_TEST_CASE(TestOutOfBoundsCountsAsEmpty)
{
    GridModel grid = openLevel();
    OccupancyMask corner = grid.maskAt({0, 0});

    BOOST_CHECK((corner & Occupancy::CENTER) != 0);
    BOOST_CHECK((corner & Occupancy::RIGHT) != 0);
    BOOST_CHECK((corner & Occupancy::BOTTOM) != 0);
    BOOST_CHECK((corner & Occupancy::BOTTOM_RIGHT) != 0);
    BOOST_CHECK((corner & Occupancy::TOP) == 0);
    BOOST_CHECK((corner & Occupancy::LEFT) == 0);
    BOOST_CHECK((corner & Occupancy::TOP_LEFT) == 0);
    BOOST_CHECK((corner & Occupancy::TOP_RIGHT) == 0);
    BOOST_CHECK((corner & Occupancy::BOTTOM_LEFT) == 0);
}

BOOST_AUTO_TEST_CASE(TestEmptyNeighboursAreClear)
{
    GridModel grid = GridModel::fromRows({
        "S.#",
        "#.G",
    }, makeSettings());

    OccupancyMask mask = grid.maskAt({1, 0});
    BOOST_CHECK((mask & Occupancy::CENTER) == 0);
    BOOST_CHECK((mask & Occupancy::BOTTOM) == 0);
    BOOST_CHECK((mask & Occupancy::LEFT) != 0);
    BOOST_CHECK((mask & Occupancy::RIGHT) != 0);
    BOOST_CHECK((mask & Occupancy::BOTTOM_LEFT) != 0);
    BOOST_CHECK((mask & Occupancy::BOTTOM_RIGHT) != 0);
}

BOOST_AUTO_TEST_CASE(TestPortalsCountAsOccupied)
{
    GridModel grid = portalCorridor('I');
    BOOST_CHECK((grid.maskAt({1, 0}) & Occupancy::RIGHT) != 0);
    BOOST_CHECK((grid.maskAt({3, 0}) & Occupancy::LEFT) != 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CellGeometryTests)

BOOST_AUTO_TEST_CASE(TestCellCenters)
{
    BOOST_CHECK(GridModel::cellCenter({0, 0}) == Vector2D(0.0f, 0.0f));
    BOOST_CHECK(GridModel::cellCenter({3, 2}) == Vector2D(12.0f, 8.0f));

    GridModel grid = openLevel();
    BOOST_CHECK(grid.spawnCenter() == Vector2D(0.0f, 0.0f));
    BOOST_CHECK(grid.goalCenter() == Vector2D(16.0f, 16.0f));
}

BOOST_AUTO_TEST_CASE(TestCellAtRoundsToNearestCenter)
{
    BOOST_CHECK(GridModel::cellAt(Vector2D(0.0f, 0.0f)) == (CellCoord{0, 0}));
    BOOST_CHECK(GridModel::cellAt(Vector2D(1.9f, -1.9f)) == (CellCoord{0, 0}));
    BOOST_CHECK(GridModel::cellAt(Vector2D(2.1f, 5.9f)) == (CellCoord{1, 1}));
    BOOST_CHECK(GridModel::cellAt(Vector2D(-2.1f, 0.0f)) == (CellCoord{-1, 0}));
    BOOST_CHECK(GridModel::cellAt(Vector2D(16.5f, 15.2f)) == (CellCoord{4, 4}));
}

BOOST_AUTO_TEST_CASE(TestInBounds)
{
    GridModel grid = shortCorridor();
    BOOST_CHECK(grid.inBounds({2, 0}));
    BOOST_CHECK(!grid.inBounds({3, 0}));
    BOOST_CHECK(!grid.inBounds({0, 1}));
    BOOST_CHECK(!grid.inBounds({-1, 0}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ModelValidationTests)

BOOST_AUTO_TEST_CASE(TestParsedModelsValidate)
{
    BOOST_CHECK_NO_THROW(openLevel().validate());
    BOOST_CHECK_NO_THROW(portalCorridor('I').validate());
}

BOOST_AUTO_TEST_CASE(TestMaskShapeMismatchThrows)
{
    GridModel missingRow = GridModel::fromRows({"S##", "###", "##G"}, makeSettings());
    missingRow.neighborMasks.pop_back();
    BOOST_CHECK_THROW(missingRow.validate(), std::invalid_argument);

    GridModel shortRow = GridModel::fromRows({"S##", "###", "##G"}, makeSettings());
    shortRow.neighborMasks[1].pop_back();
    BOOST_CHECK_THROW(shortRow.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestRaggedCellsThrow)
{
    GridModel grid = GridModel::fromRows({"S##", "###", "##G"}, makeSettings());
    grid.cells[1].pop_back();
    BOOST_CHECK_THROW(grid.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestSpawnAndGoalMustMatchTheirCells)
{
    GridModel outOfBounds = openLevel();
    outOfBounds.spawnCell = CellCoord{5, 0};
    BOOST_CHECK_THROW(outOfBounds.validate(), std::invalid_argument);

    GridModel wrongKind = openLevel();
    wrongKind.goalCell = CellCoord{2, 2};
    BOOST_CHECK_THROW(wrongKind.validate(), std::invalid_argument);

    GridModel negative = openLevel();
    negative.goalCell = CellCoord{-1, 4};
    BOOST_CHECK_THROW(negative.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestBuilderRejectsInconsistentModel)
{
    GridModel grid = GridModel::fromRows({"S##", "###", "##G"}, makeSettings());
    grid.neighborMasks.pop_back();
    BOOST_CHECK_THROW(NavSurfaceBuilder builder(grid), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
