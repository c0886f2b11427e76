/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GRID_MODEL_HPP
#define GRID_MODEL_HPP

#include <compare>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "utils/Vector2D.hpp"

namespace ArenaEngine {

// Arena spatial constants
constexpr float CELL_SIZE = 4.0f;               // World units per cell
constexpr float CORNER_INSET = CELL_SIZE / 4.0f; // Unit of the corner displacement table

enum class CellKind : uint8_t {
    EMPTY,
    FLOOR,
    SPAWN,
    GOAL,
    PORTAL_IN,
    PORTAL_OUT
};

// Direction the goal cell faces; presentation only
enum class Facing : uint8_t {
    NORTH,
    EAST,
    SOUTH,
    WEST
};

inline std::ostream& operator<<(std::ostream& os, const CellKind& kind) {
    switch (kind) {
        case CellKind::EMPTY: return os << "EMPTY";
        case CellKind::FLOOR: return os << "FLOOR";
        case CellKind::SPAWN: return os << "SPAWN";
        case CellKind::GOAL: return os << "GOAL";
        case CellKind::PORTAL_IN: return os << "PORTAL_IN";
        case CellKind::PORTAL_OUT: return os << "PORTAL_OUT";
        default: return os << "UNKNOWN";
    }
}

struct Cell {
    CellKind kind = CellKind::EMPTY;
    Facing facing = Facing::SOUTH;

    bool isEmpty() const { return kind == CellKind::EMPTY; }
    bool isPortal() const { return kind == CellKind::PORTAL_IN || kind == CellKind::PORTAL_OUT; }
};

struct CellCoord {
    int col = 0;
    int row = 0;

    auto operator<=>(const CellCoord&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const CellCoord& c) {
    return os << '(' << c.col << ", " << c.row << ')';
}

// 9-bit occupancy summary of a cell and its 8 neighbours
using OccupancyMask = uint16_t;

namespace Occupancy {
    constexpr OccupancyMask CENTER = 1 << 0;
    constexpr OccupancyMask TOP = 1 << 1;
    constexpr OccupancyMask BOTTOM = 1 << 2;
    constexpr OccupancyMask LEFT = 1 << 3;
    constexpr OccupancyMask RIGHT = 1 << 4;
    constexpr OccupancyMask TOP_LEFT = 1 << 5;
    constexpr OccupancyMask TOP_RIGHT = 1 << 6;
    constexpr OccupancyMask BOTTOM_LEFT = 1 << 7;
    constexpr OccupancyMask BOTTOM_RIGHT = 1 << 8;
}

/**
 * Per-level tuning supplied alongside the layout.
 */
struct LevelSettings {
    uint32_t populationCap = 1;          // Max live agents
    float spawnIntervalSeconds = 5.0f;   // Delay between spawns after the first
    std::optional<std::string> introMessage; // Shown at level start; lengthens the first spawn delay
    std::string goalText;
    uint32_t treasureTarget = 1;         // Deliveries required to win
    std::optional<uint32_t> lossLimit;   // Losses tolerated before the level is lost
    uint32_t obstacleBudget = 0;         // Obstacles the player may place at once
};

/**
 * Parsed, immutable level layout.
 *
 * cells and neighborMasks are indexed [row][col]. World position of a cell
 * center is (col * CELL_SIZE, row * CELL_SIZE).
 */
struct GridModel {
    std::vector<std::vector<Cell>> cells;
    std::vector<std::vector<OccupancyMask>> neighborMasks;
    CellCoord spawnCell;
    CellCoord goalCell;
    LevelSettings settings;

    int getRows() const { return static_cast<int>(cells.size()); }
    int getColumns() const { return cells.empty() ? 0 : static_cast<int>(cells[0].size()); }

    bool inBounds(const CellCoord& c) const {
        return c.row >= 0 && c.row < getRows() && c.col >= 0 && c.col < getColumns();
    }

    const Cell& at(const CellCoord& c) const { return cells[c.row][c.col]; }
    OccupancyMask maskAt(const CellCoord& c) const { return neighborMasks[c.row][c.col]; }

    static Vector2D cellCenter(const CellCoord& c) {
        return Vector2D(static_cast<float>(c.col) * CELL_SIZE, static_cast<float>(c.row) * CELL_SIZE);
    }

    // Cell whose square contains the world position (may be out of bounds)
    static CellCoord cellAt(const Vector2D& position);

    Vector2D spawnCenter() const { return cellCenter(spawnCell); }
    Vector2D goalCenter() const { return cellCenter(goalCell); }

    /**
     * Checks that the model is consistent: rectangular cells, a mask for
     * every cell, and in-bounds spawn and goal coordinates naming cells of
     * the matching kind. Models assembled outside fromCells() should pass
     * this before anything indexes them.
     * @throws std::invalid_argument describing the first inconsistency
     */
    void validate() const;

    /**
     * Builds a model from cell kinds, deriving the occupancy masks and the
     * spawn/goal coordinates.
     * @throws std::invalid_argument on empty or ragged input, or when the
     *         layout lacks exactly one spawn and one goal cell
     */
    static GridModel fromCells(std::vector<std::vector<Cell>> cells, LevelSettings settings);

    /**
     * Same as fromCells() from one string per row:
     * '.' empty, '#' floor, 'S' spawn, 'G' goal, 'I' portal in, 'O' portal out.
     */
    static GridModel fromRows(const std::vector<std::string>& rows, LevelSettings settings);
};

// Mask of cell (col, row); out-of-bounds neighbours count as empty
OccupancyMask computeOccupancyMask(const std::vector<std::vector<Cell>>& cells, int col, int row);

} // namespace ArenaEngine

#endif // GRID_MODEL_HPP
