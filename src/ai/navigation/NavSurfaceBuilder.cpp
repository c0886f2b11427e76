/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/navigation/NavSurfaceBuilder.hpp"
#include "core/Logger.hpp"
#include <array>

namespace ArenaEngine {

namespace {

struct CornerDelta {
    int dx;
    int dy;
    bool supported;
};

// Indexed by topLeft << 3 | top << 2 | left << 1 | center
constexpr std::array<CornerDelta, 16> CORNER_TABLE = {{
    { 0,  0, true},  // FFFF
    { 1,  1, true},  // FFFT
    {-1,  1, true},  // FFTF
    { 0,  1, true},  // FFTT
    { 1, -1, true},  // FTFF
    { 1,  0, true},  // FTFT
    { 0,  0, false}, // FTTF: top and left only
    { 1,  1, true},  // FTTT
    {-1, -1, true},  // TFFF
    { 0,  0, false}, // TFFT: top-left and center only
    {-1,  0, true},  // TFTF
    {-1,  1, true},  // TFTT
    { 0, -1, true},  // TTFF
    { 1, -1, true},  // TTFT
    {-1, -1, true},  // TTTF
    { 0,  0, true},  // TTTT
}};

// Position of a polygon around a vertex, in ring order
enum RingSlot : uint8_t { UPPER_RIGHT = 0, LOWER_RIGHT = 1, LOWER_LEFT = 2, UPPER_LEFT = 3 };

// Ring slot a quad occupies at each of its corners (TR, BR, BL, TL)
constexpr std::array<RingSlot, 4> QUAD_CORNER_SLOTS = {LOWER_LEFT, UPPER_LEFT, UPPER_RIGHT, LOWER_RIGHT};

struct EmittedQuad {
    CellCoord cell;
    std::array<uint32_t, 4> corners; // Vertex-grid indices, TR BR BL TL
};

// Polygons around one vertex in canonical order, runs of NO_POLYGON collapsed
using VertexRing = boost::container::small_vector<uint32_t, 4>;

uint8_t quadrantBits(bool topLeft, bool top, bool left, bool center) {
    return static_cast<uint8_t>((topLeft << 3) | (top << 2) | (left << 1) | (center << 0));
}

VertexRing collapseRing(const std::array<uint32_t, 4>& slots) {
    VertexRing ring;
    for (uint32_t polygon : slots) {
        if (!ring.empty() && polygon == NO_POLYGON && ring.back() == NO_POLYGON) continue;
        ring.push_back(polygon);
    }
    if (ring.size() > 1 && ring.front() == NO_POLYGON && ring.back() == NO_POLYGON) {
        ring.pop_back();
    }
    return ring;
}

uint32_t successorInRing(const VertexRing& ring, uint32_t polygon) {
    for (size_t i = 0; i < ring.size(); ++i) {
        if (ring[i] == polygon) {
            return ring[(i + 1) % ring.size()];
        }
    }
    return NO_POLYGON;
}

Vector2D centroidOf(const NavPolygon& polygon, const std::vector<Vector2D>& vertices) {
    Vector2D sum;
    for (uint32_t v : polygon.vertices) {
        sum += vertices[v];
    }
    return sum / static_cast<float>(polygon.vertices.size());
}

NavLayer makePlaceholderLayer(LayerId id) {
    NavLayer layer;
    layer.id = id;
    layer.placeholder = true;
    layer.vertices = {Vector2D(-150.0f, -150.0f), Vector2D(-149.0f, -150.0f), Vector2D(-149.0f, -149.0f)};

    NavPolygon triangle;
    triangle.vertices = {0, 1, 2};
    triangle.neighbors = {NO_POLYGON, NO_POLYGON, NO_POLYGON};
    triangle.centroid = centroidOf(triangle, layer.vertices);
    layer.polygons.push_back(std::move(triangle));
    return layer;
}

/**
 * Builds one layer from its quads: recovers edge adjacency through the
 * per-vertex rings and compacts the vertex list to referenced vertices.
 * remap receives, per vertex-grid index, the layer vertex index or NO_POLYGON.
 */
NavLayer finalizeLayer(LayerId id, const std::vector<EmittedQuad>& quads,
                       const std::vector<Vector2D>& gridPositions,
                       std::vector<uint32_t>& remap) {
    const size_t gridVertexCount = gridPositions.size();

    std::vector<std::array<uint32_t, 4>> slots(gridVertexCount);
    for (auto& s : slots) {
        s.fill(NO_POLYGON);
    }
    for (uint32_t p = 0; p < quads.size(); ++p) {
        for (size_t k = 0; k < 4; ++k) {
            slots[quads[p].corners[k]][QUAD_CORNER_SLOTS[k]] = p;
        }
    }

    std::vector<VertexRing> rings;
    rings.reserve(gridVertexCount);
    for (const auto& s : slots) {
        rings.push_back(collapseRing(s));
    }

    remap.assign(gridVertexCount, NO_POLYGON);
    for (const auto& quad : quads) {
        for (uint32_t corner : quad.corners) {
            remap[corner] = 0;
        }
    }

    NavLayer layer;
    layer.id = id;
    for (size_t g = 0; g < gridVertexCount; ++g) {
        if (remap[g] == NO_POLYGON) continue;
        remap[g] = static_cast<uint32_t>(layer.vertices.size());
        layer.vertices.push_back(gridPositions[g]);
    }

    layer.polygons.reserve(quads.size());
    for (uint32_t p = 0; p < quads.size(); ++p) {
        const EmittedQuad& quad = quads[p];
        NavPolygon polygon;
        polygon.cell = quad.cell;
        for (size_t k = 0; k < 4; ++k) {
            polygon.vertices.push_back(remap[quad.corners[k]]);
            // Across edge k -> k+1: the polygon following this one around vertex k+1
            polygon.neighbors.push_back(successorInRing(rings[quad.corners[(k + 1) % 4]], p));
        }
        polygon.centroid = centroidOf(polygon, layer.vertices);
        layer.polygons.push_back(std::move(polygon));
    }

    return layer;
}

} // anonymous namespace

NavSurfaceBuilder::NavSurfaceBuilder(const GridModel& grid) : m_grid(grid)
{
    m_grid.validate();
}

std::optional<Vector2D> NavSurfaceBuilder::cornerOffset(bool topLeft, bool top, bool left, bool center) {
    const CornerDelta& delta = CORNER_TABLE[quadrantBits(topLeft, top, left, center)];
    if (!delta.supported) {
        return std::nullopt;
    }
    return Vector2D(static_cast<float>(delta.dx), static_cast<float>(delta.dy));
}

std::optional<LayerId> NavSurfaceBuilder::layerFor(CellKind kind) {
    switch (kind) {
        case CellKind::EMPTY: return std::nullopt;
        case CellKind::FLOOR:
        case CellKind::SPAWN:
        case CellKind::GOAL: return LayerId::FLOOR;
        case CellKind::PORTAL_IN: return LayerId::PORTAL_IN;
        case CellKind::PORTAL_OUT: return LayerId::PORTAL_OUT;
    }
    return std::nullopt;
}

std::shared_ptr<const NavigationSurface> NavSurfaceBuilder::build(const ExclusionSet& excluded) const {
    const int columns = m_grid.getColumns();
    const int rows = m_grid.getRows();
    const int gridColumns = columns + 1;
    auto gridIndex = [gridColumns](int i, int j) {
        return static_cast<uint32_t>(j * gridColumns + i);
    };

    // Vertex (i, j) is the top-left corner of cell (i, j). Corners past the
    // last row or column read the quadrant from the in-grid cell beside them.
    std::vector<Vector2D> gridPositions;
    gridPositions.reserve(static_cast<size_t>(gridColumns) * (rows + 1));
    for (int j = 0; j <= rows; ++j) {
        for (int i = 0; i <= columns; ++i) {
            bool topLeft = false, top = false, left = false, center = false;
            if (i < columns && j < rows) {
                OccupancyMask m = m_grid.maskAt({i, j});
                topLeft = (m & Occupancy::TOP_LEFT) != 0;
                top = (m & Occupancy::TOP) != 0;
                left = (m & Occupancy::LEFT) != 0;
                center = (m & Occupancy::CENTER) != 0;
            } else if (i == columns && j < rows) {
                OccupancyMask m = m_grid.maskAt({columns - 1, j});
                topLeft = (m & Occupancy::TOP) != 0;
                left = (m & Occupancy::CENTER) != 0;
            } else if (i < columns && j == rows) {
                OccupancyMask m = m_grid.maskAt({i, rows - 1});
                topLeft = (m & Occupancy::LEFT) != 0;
                top = (m & Occupancy::CENTER) != 0;
            } else {
                topLeft = (m_grid.maskAt({columns - 1, rows - 1}) & Occupancy::CENTER) != 0;
            }

            auto offset = cornerOffset(topLeft, top, left, center);
            if (!offset) {
                uint8_t pattern = quadrantBits(topLeft, top, left, center);
                std::string what = "Unsupported corner pattern " + std::to_string(pattern) +
                                   " at vertex (" + std::to_string(i) + ", " + std::to_string(j) + ")";
                NAVSURFACE_ERROR(what);
                throw DegenerateTopologyError(what, CellCoord{i, j}, pattern);
            }

            gridPositions.emplace_back(
                static_cast<float>(i) * CELL_SIZE - CELL_SIZE / 2.0f + offset->getX() * CORNER_INSET,
                static_cast<float>(j) * CELL_SIZE - CELL_SIZE / 2.0f + offset->getY() * CORNER_INSET);
        }
    }

    std::array<std::vector<EmittedQuad>, NAV_LAYER_COUNT> quads;
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < columns; ++col) {
            CellCoord cell{col, row};
            auto layer = layerFor(m_grid.at(cell).kind);
            if (!layer) continue;
            if (*layer == LayerId::FLOOR && excluded.count(cell) > 0) continue;

            quads[static_cast<size_t>(*layer)].push_back(EmittedQuad{
                cell,
                {gridIndex(col + 1, row), gridIndex(col + 1, row + 1),
                 gridIndex(col, row + 1), gridIndex(col, row)}});
        }
    }

    if (quads[static_cast<size_t>(LayerId::FLOOR)].empty()) {
        NAVSURFACE_ERROR("Floor layer has no polygons");
        throw DegenerateTopologyError("Floor layer has no polygons", std::nullopt, 0);
    }

    std::array<NavLayer, NAV_LAYER_COUNT> layers;
    std::array<std::vector<uint32_t>, NAV_LAYER_COUNT> remaps;
    for (size_t l = 0; l < NAV_LAYER_COUNT; ++l) {
        LayerId id = static_cast<LayerId>(l);
        if (quads[l].empty()) {
            layers[l] = makePlaceholderLayer(id);
        } else {
            layers[l] = finalizeLayer(id, quads[l], gridPositions, remaps[l]);
        }
    }

    std::vector<LayerStitch> stitches;
    const auto& floorRemap = remaps[static_cast<size_t>(LayerId::FLOOR)];
    for (LayerId portal : {LayerId::PORTAL_IN, LayerId::PORTAL_OUT}) {
        size_t l = static_cast<size_t>(portal);
        if (layers[l].placeholder) continue;
        for (size_t g = 0; g < gridPositions.size(); ++g) {
            if (remaps[l][g] != NO_POLYGON && floorRemap[g] != NO_POLYGON) {
                stitches.push_back(LayerStitch{portal, remaps[l][g], floorRemap[g]});
            }
        }
    }

    NAVSURFACE_INFO("Built surface: floor " + std::to_string(layers[0].polygons.size()) +
                    " polygons, portal-in " + std::to_string(layers[1].polygons.size()) +
                    ", portal-out " + std::to_string(layers[2].polygons.size()) +
                    ", " + std::to_string(stitches.size()) + " stitches, " +
                    std::to_string(excluded.size()) + " excluded cells");

    return std::make_shared<const NavigationSurface>(columns, rows, std::move(layers), std::move(stitches));
}

} // namespace ArenaEngine
