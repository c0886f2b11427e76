/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/navigation/NavigationSurface.hpp"
#include <algorithm>

namespace ArenaEngine {

NavigationSurface::NavigationSurface(int columns, int rows,
                                     std::array<NavLayer, NAV_LAYER_COUNT> layers,
                                     std::vector<LayerStitch> stitches)
    : m_columns(columns), m_rows(rows), m_layers(std::move(layers)),
      m_stitches(std::move(stitches)) {}

size_t NavigationSurface::getTotalPolygonCount() const {
    size_t total = 0;
    for (const auto& layer : m_layers) {
        total += layer.polygons.size();
    }
    return total;
}

bool NavigationSurface::isTopologicallyEquivalent(const NavigationSurface& other) const {
    if (m_stitches.size() != other.m_stitches.size()) return false;
    for (size_t i = 0; i < NAV_LAYER_COUNT; ++i) {
        if (m_layers[i].polygons.size() != other.m_layers[i].polygons.size() ||
            m_layers[i].placeholder != other.m_layers[i].placeholder) {
            return false;
        }
    }
    return true;
}

bool NavigationSurface::isGeometricallyEqual(const NavigationSurface& other) const {
    if (m_columns != other.m_columns || m_rows != other.m_rows) return false;
    if (!isTopologicallyEquivalent(other)) return false;

    for (size_t i = 0; i < NAV_LAYER_COUNT; ++i) {
        const NavLayer& a = m_layers[i];
        const NavLayer& b = other.m_layers[i];
        if (a.vertices != b.vertices) return false;
        for (size_t p = 0; p < a.polygons.size(); ++p) {
            const NavPolygon& pa = a.polygons[p];
            const NavPolygon& pb = b.polygons[p];
            if (pa.vertices != pb.vertices || pa.neighbors != pb.neighbors || pa.cell != pb.cell) {
                return false;
            }
        }
    }
    return std::equal(m_stitches.begin(), m_stitches.end(), other.m_stitches.begin(),
                      [](const LayerStitch& x, const LayerStitch& y) {
                          return x.layer == y.layer && x.layerVertex == y.layerVertex &&
                                 x.floorVertex == y.floorVertex;
                      });
}

void NavigationSurface::getLayerBounds(LayerId layer, Vector2D& outMin, Vector2D& outMax) const {
    const NavLayer& navLayer = getLayer(layer);
    if (navLayer.vertices.empty()) {
        outMin = outMax = Vector2D();
        return;
    }
    float minX = navLayer.vertices[0].getX(), maxX = minX;
    float minY = navLayer.vertices[0].getY(), maxY = minY;
    for (const auto& v : navLayer.vertices) {
        minX = std::min(minX, v.getX());
        maxX = std::max(maxX, v.getX());
        minY = std::min(minY, v.getY());
        maxY = std::max(maxY, v.getY());
    }
    outMin = Vector2D(minX, minY);
    outMax = Vector2D(maxX, maxY);
}

} // namespace ArenaEngine
