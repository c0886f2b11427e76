/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/GridModel.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <stdexcept>

namespace ArenaEngine {

namespace {

bool occupied(const std::vector<std::vector<Cell>>& cells, int col, int row) {
    if (row < 0 || row >= static_cast<int>(cells.size())) return false;
    if (col < 0 || col >= static_cast<int>(cells[row].size())) return false;
    return !cells[row][col].isEmpty();
}

Cell cellFromSymbol(char symbol) {
    switch (symbol) {
        case '.': return Cell{CellKind::EMPTY};
        case '#': return Cell{CellKind::FLOOR};
        case 'S': return Cell{CellKind::SPAWN};
        case 'G': return Cell{CellKind::GOAL};
        case 'I': return Cell{CellKind::PORTAL_IN};
        case 'O': return Cell{CellKind::PORTAL_OUT};
        default:
            throw std::invalid_argument(std::string("Unknown cell symbol '") + symbol + "'");
    }
}

} // anonymous namespace

OccupancyMask computeOccupancyMask(const std::vector<std::vector<Cell>>& cells, int col, int row) {
    OccupancyMask mask = 0;
    if (occupied(cells, col, row)) mask |= Occupancy::CENTER;
    if (occupied(cells, col, row - 1)) mask |= Occupancy::TOP;
    if (occupied(cells, col, row + 1)) mask |= Occupancy::BOTTOM;
    if (occupied(cells, col - 1, row)) mask |= Occupancy::LEFT;
    if (occupied(cells, col + 1, row)) mask |= Occupancy::RIGHT;
    if (occupied(cells, col - 1, row - 1)) mask |= Occupancy::TOP_LEFT;
    if (occupied(cells, col + 1, row - 1)) mask |= Occupancy::TOP_RIGHT;
    if (occupied(cells, col - 1, row + 1)) mask |= Occupancy::BOTTOM_LEFT;
    if (occupied(cells, col + 1, row + 1)) mask |= Occupancy::BOTTOM_RIGHT;
    return mask;
}

CellCoord GridModel::cellAt(const Vector2D& position) {
    return CellCoord{static_cast<int>(std::floor(position.getX() / CELL_SIZE + 0.5f)),
                     static_cast<int>(std::floor(position.getY() / CELL_SIZE + 0.5f))};
}

void GridModel::validate() const {
    if (cells.empty() || cells[0].empty()) {
        throw std::invalid_argument("Grid must have at least one row and one column");
    }
    const size_t columns = cells[0].size();
    for (size_t row = 0; row < cells.size(); ++row) {
        if (cells[row].size() != columns) {
            throw std::invalid_argument("Grid row " + std::to_string(row) + " has " +
                                        std::to_string(cells[row].size()) + " cells, expected " +
                                        std::to_string(columns));
        }
    }

    if (neighborMasks.size() != cells.size()) {
        throw std::invalid_argument("Grid has " + std::to_string(cells.size()) + " rows but " +
                                    std::to_string(neighborMasks.size()) + " mask rows");
    }
    for (size_t row = 0; row < neighborMasks.size(); ++row) {
        if (neighborMasks[row].size() != columns) {
            throw std::invalid_argument("Mask row " + std::to_string(row) + " has " +
                                        std::to_string(neighborMasks[row].size()) + " entries, expected " +
                                        std::to_string(columns));
        }
    }

    if (!inBounds(spawnCell) || at(spawnCell).kind != CellKind::SPAWN) {
        throw std::invalid_argument("Spawn coordinate (" + std::to_string(spawnCell.col) + ", " +
                                    std::to_string(spawnCell.row) + ") is not a spawn cell");
    }
    if (!inBounds(goalCell) || at(goalCell).kind != CellKind::GOAL) {
        throw std::invalid_argument("Goal coordinate (" + std::to_string(goalCell.col) + ", " +
                                    std::to_string(goalCell.row) + ") is not a goal cell");
    }
}

GridModel GridModel::fromCells(std::vector<std::vector<Cell>> cells, LevelSettings settings) {
    if (cells.empty() || cells[0].empty()) {
        throw std::invalid_argument("Grid must have at least one row and one column");
    }
    const size_t columns = cells[0].size();

    GridModel model;
    std::optional<CellCoord> spawn;
    std::optional<CellCoord> goal;

    for (size_t row = 0; row < cells.size(); ++row) {
        if (cells[row].size() != columns) {
            throw std::invalid_argument("Grid row " + std::to_string(row) + " has " +
                                        std::to_string(cells[row].size()) + " cells, expected " +
                                        std::to_string(columns));
        }
        for (size_t col = 0; col < columns; ++col) {
            CellCoord coord{static_cast<int>(col), static_cast<int>(row)};
            switch (cells[row][col].kind) {
                case CellKind::SPAWN:
                    if (spawn) throw std::invalid_argument("Grid has more than one spawn cell");
                    spawn = coord;
                    break;
                case CellKind::GOAL:
                    if (goal) throw std::invalid_argument("Grid has more than one goal cell");
                    goal = coord;
                    break;
                default:
                    break;
            }
        }
    }
    if (!spawn || !goal) {
        throw std::invalid_argument("Grid requires one spawn cell and one goal cell");
    }

    model.neighborMasks.assign(cells.size(), std::vector<OccupancyMask>(columns, 0));
    for (size_t row = 0; row < cells.size(); ++row) {
        for (size_t col = 0; col < columns; ++col) {
            model.neighborMasks[row][col] =
                computeOccupancyMask(cells, static_cast<int>(col), static_cast<int>(row));
        }
    }

    model.cells = std::move(cells);
    model.spawnCell = *spawn;
    model.goalCell = *goal;
    model.settings = std::move(settings);

    GRID_DEBUG("Grid model " + std::to_string(model.getColumns()) + "x" +
               std::to_string(model.getRows()) + " with cap " +
               std::to_string(model.settings.populationCap));
    return model;
}

GridModel GridModel::fromRows(const std::vector<std::string>& rows, LevelSettings settings) {
    std::vector<std::vector<Cell>> cells;
    cells.reserve(rows.size());
    for (const auto& line : rows) {
        std::vector<Cell> row;
        row.reserve(line.size());
        for (char symbol : line) {
            row.push_back(cellFromSymbol(symbol));
        }
        cells.push_back(std::move(row));
    }
    return fromCells(std::move(cells), std::move(settings));
}

} // namespace ArenaEngine
