/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NAVIGATION_SURFACE_HPP
#define NAVIGATION_SURFACE_HPP

#include <array>
#include <bitset>
#include <cstdint>
#include <iostream>
#include <limits>
#include <vector>
#include <boost/container/small_vector.hpp>
#include "utils/Vector2D.hpp"
#include "world/GridModel.hpp"

namespace ArenaEngine {

enum class LayerId : uint8_t {
    FLOOR = 0,
    PORTAL_IN = 1,
    PORTAL_OUT = 2
};

constexpr size_t NAV_LAYER_COUNT = 3;
constexpr uint32_t NO_POLYGON = std::numeric_limits<uint32_t>::max();

// Set of layers a query may not enter
using LayerMask = std::bitset<NAV_LAYER_COUNT>;

inline LayerMask layerMaskOf(LayerId layer) {
    LayerMask mask;
    mask.set(static_cast<size_t>(layer));
    return mask;
}

inline std::ostream& operator<<(std::ostream& os, const LayerId& layer) {
    switch (layer) {
        case LayerId::FLOOR: return os << "FLOOR";
        case LayerId::PORTAL_IN: return os << "PORTAL_IN";
        case LayerId::PORTAL_OUT: return os << "PORTAL_OUT";
        default: return os << "UNKNOWN";
    }
}

/**
 * Convex polygon of one layer, wound counter-clockwise in (x, y) axis
 * orientation. neighbors[i] is the polygon across the edge
 * vertices[i] -> vertices[(i + 1) % n] in the same layer, or NO_POLYGON.
 */
struct NavPolygon {
    boost::container::small_vector<uint32_t, 4> vertices;
    boost::container::small_vector<uint32_t, 4> neighbors;
    CellCoord cell{-1, -1};   // Source cell, (-1, -1) for placeholders
    Vector2D centroid;
};

struct NavLayer {
    LayerId id = LayerId::FLOOR;
    std::vector<Vector2D> vertices;
    std::vector<NavPolygon> polygons;
    bool placeholder = false;   // Single triangle far outside the arena

    const Vector2D& vertex(uint32_t index) const { return vertices[index]; }
};

// Vertex of a portal layer that coincides with a floor-layer vertex
struct LayerStitch {
    LayerId layer = LayerId::PORTAL_IN;
    uint32_t layerVertex = 0;
    uint32_t floorVertex = 0;
};

/**
 * @brief Immutable multi-layer navigation mesh built from a GridModel.
 *
 * Layer 0 is the floor, layer 1 the in-portal plane and layer 2 the
 * out-portal plane. Stitches join portal-layer vertices to floor vertices at
 * identical coordinates; portal transitions cost nothing beyond the distance
 * walked. Instances are shared read-only and replaced wholesale on rebuild.
 */
class NavigationSurface {
public:
    NavigationSurface(int columns, int rows, std::array<NavLayer, NAV_LAYER_COUNT> layers,
                      std::vector<LayerStitch> stitches);

    const NavLayer& getLayer(LayerId layer) const { return m_layers[static_cast<size_t>(layer)]; }
    const std::vector<LayerStitch>& getStitches() const { return m_stitches; }

    int getColumns() const { return m_columns; }
    int getRows() const { return m_rows; }

    size_t getPolygonCount(LayerId layer) const { return getLayer(layer).polygons.size(); }
    size_t getTotalPolygonCount() const;

    // Same polygon count per layer and same stitch count
    bool isTopologicallyEquivalent(const NavigationSurface& other) const;

    // Bit-identical vertices, polygons, adjacency and stitches
    bool isGeometricallyEqual(const NavigationSurface& other) const;

    // Axis-aligned bounds of the polygons of one layer
    void getLayerBounds(LayerId layer, Vector2D& outMin, Vector2D& outMax) const;

private:
    int m_columns;
    int m_rows;
    std::array<NavLayer, NAV_LAYER_COUNT> m_layers;
    std::vector<LayerStitch> m_stitches;
};

} // namespace ArenaEngine

#endif // NAVIGATION_SURFACE_HPP
