/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_PLANNER_HPP
#define PATH_PLANNER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <vector>
#include <boost/container/small_vector.hpp>
#include "ai/SimulationConfig.hpp"
#include "ai/navigation/NavigationSurface.hpp"
#include "utils/Vector2D.hpp"

namespace ArenaEngine {

enum class PlanResult { SUCCESS, NO_PATH_FOUND, INVALID_START, INVALID_GOAL, TIMEOUT };

inline std::ostream& operator<<(std::ostream& os, const PlanResult& result) {
    switch (result) {
        case PlanResult::SUCCESS: return os << "SUCCESS";
        case PlanResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PlanResult::INVALID_START: return os << "INVALID_START";
        case PlanResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case PlanResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

struct NavPolygonRef {
    LayerId layer = LayerId::FLOOR;
    uint32_t polygon = NO_POLYGON;
};

struct PlannedRoute {
    std::vector<Vector2D> waypoints;      // from (or its snapped point) ... to, turning points only
    std::vector<NavPolygonRef> corridor;  // Polygons crossed, in order
};

/**
 * @brief Shortest-path queries over one NavigationSurface.
 *
 * A* runs over polygon adjacency (shared edges within a layer, stitched
 * edges between the floor and a portal layer) using edge midpoints as
 * search points; the polygon corridor is then straightened with the funnel
 * algorithm. The avoidance delta widens the radius used to snap off-mesh
 * endpoints onto the mesh and adds a penalty per portal seam crossed.
 *
 * The planner keeps the surface alive; a rebuilt surface gets a new planner.
 */
class PathPlanner {
public:
    explicit PathPlanner(std::shared_ptr<const NavigationSurface> surface, const PlannerConfig& config = {});

    /**
     * Plans from `from` to `to` without entering excludedLayers.
     * @return waypoints whose last element is exactly `to`, or std::nullopt
     *         when no route exists under the constraints
     */
    std::optional<std::vector<Vector2D>> plan(const Vector2D& from, const Vector2D& to,
                                              LayerMask excludedLayers, float avoidanceDelta);

    PlanResult planRoute(const Vector2D& from, const Vector2D& to, LayerMask excludedLayers,
                         float avoidanceDelta, PlannedRoute& outRoute);

    // Polygon containing the point, or the closest one within maxDistance
    std::optional<NavPolygonRef> locate(const Vector2D& point, LayerMask excludedLayers,
                                        float maxDistance, Vector2D* outOnMesh = nullptr) const;

    const NavigationSurface& getSurface() const { return *m_surface; }

    struct PlannerStats {
        uint64_t totalRequests{0};
        uint64_t successfulPaths{0};
        uint64_t noPathResults{0};
        uint64_t invalidEndpoints{0};
        uint64_t timeouts{0};
        uint64_t totalExpansions{0};
    };

    void resetStats() { m_stats = PlannerStats{}; }
    const PlannerStats& getStats() const { return m_stats; }

private:
    // Edge from one node to a neighbouring node; left/right as seen leaving the source
    struct NavLink {
        uint32_t target;
        Vector2D left;
        Vector2D right;
        bool seam;   // Crosses between the floor and a portal layer
    };

    struct Node {
        NavPolygonRef ref;
        boost::container::small_vector<NavLink, 4> links;
    };

    std::shared_ptr<const NavigationSurface> m_surface;
    PlannerConfig m_config;
    std::vector<Node> m_nodes;
    std::array<uint32_t, NAV_LAYER_COUNT> m_layerBase{};
    std::vector<boost::container::small_vector<uint32_t, 2>> m_cellNodes; // Row-major per grid cell
    PlannerStats m_stats{};

    void buildGraph();
    uint32_t nodeIndex(const NavPolygonRef& ref) const {
        return m_layerBase[static_cast<size_t>(ref.layer)] + ref.polygon;
    }
    const NavPolygon& polygonOf(uint32_t node) const;
    bool containsPoint(uint32_t node, const Vector2D& point) const;
    Vector2D closestPointOn(uint32_t node, const Vector2D& point) const;

    static std::vector<Vector2D> stringPull(const Vector2D& start, const Vector2D& goal,
                                            const std::vector<std::pair<Vector2D, Vector2D>>& portals);
};

} // namespace ArenaEngine

#endif // PATH_PLANNER_HPP
