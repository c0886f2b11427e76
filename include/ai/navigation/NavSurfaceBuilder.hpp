/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NAV_SURFACE_BUILDER_HPP
#define NAV_SURFACE_BUILDER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/container/flat_set.hpp>
#include "ai/navigation/NavigationSurface.hpp"
#include "world/GridModel.hpp"

namespace ArenaEngine {

// Cells blocked by player-placed obstacles
using ExclusionSet = boost::container::flat_set<CellCoord>;

/**
 * Raised when a layout contains an adjacency pattern the corner table cannot
 * represent. A level-authoring error: the level cannot be loaded.
 */
class DegenerateTopologyError : public std::runtime_error {
public:
    DegenerateTopologyError(const std::string& what, std::optional<CellCoord> corner,
                            uint8_t pattern)
        : std::runtime_error(what), m_corner(corner), m_pattern(pattern) {}

    // Vertex-grid corner (top-left corner of that cell), if the failure is local
    const std::optional<CellCoord>& getCorner() const { return m_corner; }

    // Quadrant bits: top-left << 3 | top << 2 | left << 1 | center
    uint8_t getPattern() const { return m_pattern; }

private:
    std::optional<CellCoord> m_corner;
    uint8_t m_pattern;
};

/**
 * @brief Turns a GridModel and an ExclusionSet into a NavigationSurface.
 *
 * One quad per cell: floor, spawn and goal cells go to the floor layer
 * unless excluded, portal cells to their portal layer. Quad corners are
 * displaced by a table keyed on the surrounding occupancy so that polygon
 * boundaries follow the walls. Adjacency is recovered per vertex from the
 * polygons touching it; the per-vertex rings are scratch and do not survive
 * into the surface.
 */
class NavSurfaceBuilder {
public:
    // @throws std::invalid_argument if the grid fails GridModel::validate()
    explicit NavSurfaceBuilder(const GridModel& grid);

    /**
     * @throws DegenerateTopologyError for unsupported corner patterns or when
     *         the floor layer ends up with no polygons
     */
    std::shared_ptr<const NavigationSurface> build(const ExclusionSet& excluded) const;

    /**
     * Corner displacement, in CORNER_INSET units, for the quadrant around a
     * vertex. std::nullopt for the two diagonal-only patterns.
     */
    static std::optional<Vector2D> cornerOffset(bool topLeft, bool top, bool left, bool center);

    // Target layer for a cell kind; std::nullopt for empty cells
    static std::optional<LayerId> layerFor(CellKind kind);

private:
    const GridModel& m_grid;
};

} // namespace ArenaEngine

#endif // NAV_SURFACE_BUILDER_HPP
