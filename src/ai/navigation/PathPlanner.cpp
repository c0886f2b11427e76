/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/navigation/PathPlanner.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <utility>
#include <boost/container/flat_map.hpp>

namespace ArenaEngine {

namespace {

constexpr float CONTAINMENT_EPSILON = 1e-4f;

struct OpenNode {
    uint32_t node;
    float f;
};

struct OpenNodeCmp {
    bool operator()(const OpenNode& a, const OpenNode& b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.node > b.node; // Stable expansion order on ties
    }
};

Vector2D closestPointOnSegment(const Vector2D& a, const Vector2D& b, const Vector2D& p) {
    Vector2D ab = b - a;
    float lenSq = ab.lengthSquared();
    if (lenSq <= 0.0f) return a;
    float t = std::clamp((p - a).dot(ab) / lenSq, 0.0f, 1.0f);
    return a + ab * t;
}

} // anonymous namespace

PathPlanner::PathPlanner(std::shared_ptr<const NavigationSurface> surface, const PlannerConfig& config)
    : m_surface(std::move(surface)), m_config(config) {
    buildGraph();
}

void PathPlanner::buildGraph() {
    const NavigationSurface& surface = *m_surface;

    size_t total = 0;
    for (size_t l = 0; l < NAV_LAYER_COUNT; ++l) {
        m_layerBase[l] = static_cast<uint32_t>(total);
        total += surface.getLayer(static_cast<LayerId>(l)).polygons.size();
    }
    m_nodes.assign(total, Node{});

    const int columns = surface.getColumns();
    const int rows = surface.getRows();
    m_cellNodes.assign(static_cast<size_t>(columns) * rows, {});

    // Same-layer links from shared edges
    for (size_t l = 0; l < NAV_LAYER_COUNT; ++l) {
        const NavLayer& layer = surface.getLayer(static_cast<LayerId>(l));
        for (uint32_t p = 0; p < layer.polygons.size(); ++p) {
            const NavPolygon& polygon = layer.polygons[p];
            uint32_t node = m_layerBase[l] + p;
            m_nodes[node].ref = NavPolygonRef{layer.id, p};

            if (!layer.placeholder && polygon.cell.col >= 0 && polygon.cell.col < columns &&
                polygon.cell.row >= 0 && polygon.cell.row < rows) {
                m_cellNodes[static_cast<size_t>(polygon.cell.row) * columns + polygon.cell.col].push_back(node);
            }

            const size_t n = polygon.vertices.size();
            for (size_t k = 0; k < n; ++k) {
                if (polygon.neighbors[k] == NO_POLYGON) continue;
                // Counter-clockwise winding: leaving across edge a->b, b is on the left
                const Vector2D& a = layer.vertex(polygon.vertices[k]);
                const Vector2D& b = layer.vertex(polygon.vertices[(k + 1) % n]);
                m_nodes[node].links.push_back(NavLink{m_layerBase[l] + polygon.neighbors[k], b, a, false});
            }
        }
    }

    // Seam links: a portal polygon boundary edge whose stitched vertices form
    // an edge of a floor polygon
    const NavLayer& floor = surface.getLayer(LayerId::FLOOR);
    boost::container::flat_map<std::pair<uint32_t, uint32_t>, uint32_t> floorEdges;
    for (uint32_t p = 0; p < floor.polygons.size(); ++p) {
        const auto& verts = floor.polygons[p].vertices;
        for (size_t k = 0; k < verts.size(); ++k) {
            floorEdges[{verts[k], verts[(k + 1) % verts.size()]}] = p;
        }
    }

    for (LayerId portal : {LayerId::PORTAL_IN, LayerId::PORTAL_OUT}) {
        const NavLayer& layer = surface.getLayer(portal);
        if (layer.placeholder) continue;

        boost::container::flat_map<uint32_t, uint32_t> toFloor;
        for (const auto& stitch : surface.getStitches()) {
            if (stitch.layer == portal) {
                toFloor[stitch.layerVertex] = stitch.floorVertex;
            }
        }

        const uint32_t base = m_layerBase[static_cast<size_t>(portal)];
        for (uint32_t p = 0; p < layer.polygons.size(); ++p) {
            const NavPolygon& polygon = layer.polygons[p];
            const size_t n = polygon.vertices.size();
            for (size_t k = 0; k < n; ++k) {
                if (polygon.neighbors[k] != NO_POLYGON) continue;
                uint32_t a = polygon.vertices[k];
                uint32_t b = polygon.vertices[(k + 1) % n];
                auto fa = toFloor.find(a);
                auto fb = toFloor.find(b);
                if (fa == toFloor.end() || fb == toFloor.end()) continue;

                // The floor polygon on the other side runs the edge the opposite way
                auto edge = floorEdges.find({fb->second, fa->second});
                if (edge == floorEdges.end()) continue;

                uint32_t floorNode = m_layerBase[0] + edge->second;
                const Vector2D& pa = layer.vertex(a);
                const Vector2D& pb = layer.vertex(b);
                m_nodes[base + p].links.push_back(NavLink{floorNode, pb, pa, true});
                m_nodes[floorNode].links.push_back(NavLink{base + p, pa, pb, true});
            }
        }
    }

    PLANNER_DEBUG("Planner graph ready with " + std::to_string(total) + " polygons");
}

const NavPolygon& PathPlanner::polygonOf(uint32_t node) const {
    const NavPolygonRef& ref = m_nodes[node].ref;
    return m_surface->getLayer(ref.layer).polygons[ref.polygon];
}

bool PathPlanner::containsPoint(uint32_t node, const Vector2D& point) const {
    const NavPolygon& polygon = polygonOf(node);
    const NavLayer& layer = m_surface->getLayer(m_nodes[node].ref.layer);
    const size_t n = polygon.vertices.size();
    for (size_t k = 0; k < n; ++k) {
        const Vector2D& a = layer.vertex(polygon.vertices[k]);
        const Vector2D& b = layer.vertex(polygon.vertices[(k + 1) % n]);
        if ((b - a).cross(point - a) < -CONTAINMENT_EPSILON) {
            return false;
        }
    }
    return true;
}

Vector2D PathPlanner::closestPointOn(uint32_t node, const Vector2D& point) const {
    if (containsPoint(node, point)) {
        return point;
    }
    const NavPolygon& polygon = polygonOf(node);
    const NavLayer& layer = m_surface->getLayer(m_nodes[node].ref.layer);
    const size_t n = polygon.vertices.size();

    Vector2D best;
    float bestDistSq = std::numeric_limits<float>::infinity();
    for (size_t k = 0; k < n; ++k) {
        Vector2D candidate = closestPointOnSegment(layer.vertex(polygon.vertices[k]),
                                                   layer.vertex(polygon.vertices[(k + 1) % n]), point);
        float distSq = Vector2D::distanceSquared(candidate, point);
        if (distSq < bestDistSq) {
            bestDistSq = distSq;
            best = candidate;
        }
    }
    return best;
}

std::optional<NavPolygonRef> PathPlanner::locate(const Vector2D& point, LayerMask excludedLayers,
                                                 float maxDistance, Vector2D* outOnMesh) const {
    const int columns = m_surface->getColumns();
    const int rows = m_surface->getRows();
    const CellCoord center = GridModel::cellAt(point);

    auto forEachNodeAround = [&](int radius, auto&& visit) {
        for (int row = center.row - radius; row <= center.row + radius; ++row) {
            if (row < 0 || row >= rows) continue;
            for (int col = center.col - radius; col <= center.col + radius; ++col) {
                if (col < 0 || col >= columns) continue;
                for (uint32_t node : m_cellNodes[static_cast<size_t>(row) * columns + col]) {
                    if (excludedLayers.test(static_cast<size_t>(m_nodes[node].ref.layer))) continue;
                    if (visit(node)) return;
                }
            }
        }
    };

    // Corner displacement moves polygon edges by at most CORNER_INSET, so a
    // containing polygon is always in the 3x3 block around the point's cell
    std::optional<uint32_t> found;
    forEachNodeAround(1, [&](uint32_t node) {
        if (containsPoint(node, point)) {
            found = node;
            return true;
        }
        return false;
    });
    if (found) {
        if (outOnMesh) *outOnMesh = point;
        return m_nodes[*found].ref;
    }

    if (maxDistance <= 0.0f) {
        return std::nullopt;
    }

    float bestDistSq = maxDistance * maxDistance;
    Vector2D bestPoint;
    const int radius = 1 + static_cast<int>(std::ceil(maxDistance / CELL_SIZE));
    forEachNodeAround(radius, [&](uint32_t node) {
        Vector2D candidate = closestPointOn(node, point);
        float distSq = Vector2D::distanceSquared(candidate, point);
        if (distSq <= bestDistSq) {
            if (!found || distSq < bestDistSq) {
                found = node;
                bestPoint = candidate;
                bestDistSq = distSq;
            }
        }
        return false;
    });
    if (!found) {
        return std::nullopt;
    }
    if (outOnMesh) *outOnMesh = bestPoint;
    return m_nodes[*found].ref;
}

std::optional<std::vector<Vector2D>> PathPlanner::plan(const Vector2D& from, const Vector2D& to,
                                                       LayerMask excludedLayers, float avoidanceDelta) {
    PlannedRoute route;
    if (planRoute(from, to, excludedLayers, avoidanceDelta, route) != PlanResult::SUCCESS) {
        return std::nullopt;
    }
    return std::move(route.waypoints);
}

PlanResult PathPlanner::planRoute(const Vector2D& from, const Vector2D& to, LayerMask excludedLayers,
                                  float avoidanceDelta, PlannedRoute& outRoute) {
    ++m_stats.totalRequests;
    outRoute.waypoints.clear();
    outRoute.corridor.clear();

    Vector2D startPoint;
    Vector2D goalPoint;
    auto startRef = locate(from, excludedLayers, avoidanceDelta, &startPoint);
    if (!startRef) {
        ++m_stats.invalidEndpoints;
        PLANNER_DEBUG("Start point is off the allowed mesh");
        return PlanResult::INVALID_START;
    }
    auto goalRef = locate(to, excludedLayers, avoidanceDelta, &goalPoint);
    if (!goalRef) {
        ++m_stats.invalidEndpoints;
        PLANNER_DEBUG("Goal point is off the allowed mesh");
        return PlanResult::INVALID_GOAL;
    }

    const uint32_t startNode = nodeIndex(*startRef);
    const uint32_t goalNode = nodeIndex(*goalRef);
    const size_t nodeCount = m_nodes.size();
    const float seamPenalty = std::max(avoidanceDelta, 0.0f) * m_config.seamPenaltyScale;

    std::vector<float> gScore(nodeCount, std::numeric_limits<float>::infinity());
    std::vector<uint32_t> parent(nodeCount, NO_POLYGON);
    std::vector<uint8_t> parentLink(nodeCount, 0);
    std::vector<uint8_t> closed(nodeCount, 0);
    std::vector<Vector2D> entryPoint(nodeCount);
    std::priority_queue<OpenNode, std::vector<OpenNode>, OpenNodeCmp> open;

    gScore[startNode] = 0.0f;
    entryPoint[startNode] = startPoint;
    open.push(OpenNode{startNode, Vector2D::distance(startPoint, goalPoint)});

    bool found = false;
    int iterations = 0;
    while (!open.empty()) {
        OpenNode current = open.top();
        open.pop();
        if (closed[current.node]) continue;
        closed[current.node] = 1;

        if (current.node == goalNode) {
            found = true;
            break;
        }
        if (++iterations > m_config.maxSearchIterations) {
            m_stats.totalExpansions += static_cast<uint64_t>(iterations);
            ++m_stats.timeouts;
            PLANNER_WARN("Search exceeded " + std::to_string(m_config.maxSearchIterations) + " expansions");
            return PlanResult::TIMEOUT;
        }

        const auto& links = m_nodes[current.node].links;
        for (size_t li = 0; li < links.size(); ++li) {
            const NavLink& link = links[li];
            if (closed[link.target]) continue;
            if (excludedLayers.test(static_cast<size_t>(m_nodes[link.target].ref.layer))) continue;

            Vector2D mid = (link.left + link.right) * 0.5f;
            float tentative = gScore[current.node] + Vector2D::distance(entryPoint[current.node], mid);
            if (link.seam) {
                tentative += seamPenalty;
            }
            if (tentative < gScore[link.target]) {
                gScore[link.target] = tentative;
                entryPoint[link.target] = mid;
                parent[link.target] = current.node;
                parentLink[link.target] = static_cast<uint8_t>(li);
                open.push(OpenNode{link.target, tentative + Vector2D::distance(mid, goalPoint)});
            }
        }
    }
    m_stats.totalExpansions += static_cast<uint64_t>(iterations);

    if (!found) {
        ++m_stats.noPathResults;
        PLANNER_INFO("No path between polygons " + std::to_string(startNode) + " and " +
                     std::to_string(goalNode));
        return PlanResult::NO_PATH_FOUND;
    }

    std::vector<uint32_t> nodes;
    for (uint32_t node = goalNode; node != NO_POLYGON; node = parent[node]) {
        nodes.push_back(node);
    }
    std::reverse(nodes.begin(), nodes.end());

    std::vector<std::pair<Vector2D, Vector2D>> portals;
    portals.reserve(nodes.size());
    outRoute.corridor.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        outRoute.corridor.push_back(m_nodes[nodes[i]].ref);
        if (i > 0) {
            const NavLink& link = m_nodes[nodes[i - 1]].links[parentLink[nodes[i]]];
            portals.emplace_back(link.left, link.right);
        }
    }

    outRoute.waypoints = stringPull(startPoint, goalPoint, portals);
    // A snapped start keeps the caller's position in front so the path leaves from it
    if (outRoute.waypoints.front() != from) {
        outRoute.waypoints.insert(outRoute.waypoints.begin(), from);
    }
    if (outRoute.waypoints.back() != to) {
        outRoute.waypoints.push_back(to);
    }

    ++m_stats.successfulPaths;
    return PlanResult::SUCCESS;
}

std::vector<Vector2D> PathPlanner::stringPull(const Vector2D& start, const Vector2D& goal,
                                              const std::vector<std::pair<Vector2D, Vector2D>>& portals) {
    // Funnel over (left, right) pairs, bracketed by the degenerate start and goal portals
    std::vector<std::pair<Vector2D, Vector2D>> funnel;
    funnel.reserve(portals.size() + 2);
    funnel.emplace_back(start, start);
    funnel.insert(funnel.end(), portals.begin(), portals.end());
    funnel.emplace_back(goal, goal);

    std::vector<Vector2D> points;
    points.push_back(start);

    Vector2D apex = start;
    Vector2D portalLeft = start;
    Vector2D portalRight = start;
    size_t apexIndex = 0, leftIndex = 0, rightIndex = 0;

    for (size_t i = 1; i < funnel.size(); ++i) {
        const Vector2D& left = funnel[i].first;
        const Vector2D& right = funnel[i].second;

        // Tighten the right side
        if (Vector2D::triangleArea2(apex, portalRight, right) >= 0.0f) {
            if (apex == portalRight || Vector2D::triangleArea2(apex, portalLeft, right) < 0.0f) {
                portalRight = right;
                rightIndex = i;
            } else {
                // Right crossed the left edge: left vertex becomes a corner
                if (points.back() != portalLeft) points.push_back(portalLeft);
                apex = portalLeft;
                apexIndex = leftIndex;
                portalRight = apex;
                rightIndex = apexIndex;
                i = apexIndex;
                continue;
            }
        }

        // Tighten the left side
        if (Vector2D::triangleArea2(apex, portalLeft, left) <= 0.0f) {
            if (apex == portalLeft || Vector2D::triangleArea2(apex, portalRight, left) > 0.0f) {
                portalLeft = left;
                leftIndex = i;
            } else {
                if (points.back() != portalRight) points.push_back(portalRight);
                apex = portalRight;
                apexIndex = rightIndex;
                portalLeft = apex;
                leftIndex = apexIndex;
                i = apexIndex;
                continue;
            }
        }
    }

    if (points.back() != goal) {
        points.push_back(goal);
    }
    return points;
}

} // namespace ArenaEngine
