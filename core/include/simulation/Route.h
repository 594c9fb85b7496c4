#ifndef HELIOSTRATEGY_ROUTE_H
#define HELIOSTRATEGY_ROUTE_H

#include <cstddef>
#include <vector>

namespace helio {
namespace sim {

/**
 * @brief A node of the race route as supplied by the GIS collaborator.
 */
struct RouteNode {
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double distance_m = 0.0;              ///< Cumulative distance from the route origin
    double elevation_m = 0.0;
    double gradient = 0.0;                ///< Rise over run towards the next node
    double speed_limit_kmh = 0.0;         ///< Legal limit from this node onwards
    double time_zone_s = 0.0;             ///< UTC offset in seconds
    double curvature = 0.0;               ///< 1/m
};

/**
 * @brief Immutable route geometry.
 *
 * Bearings and segment midpoints are derived once at construction so that
 * lookups during the tick loop are plain array reads.
 */
class Route {
public:
    /**
     * @param nodes Route nodes in travel order; cumulative distance must be
     *        non-decreasing and the first node must sit at distance 0.
     * @param tiling Number of times the route is driven back to back (laps).
     * @throws PreconditionError on an empty route, bad tiling or decreasing distances.
     */
    explicit Route(std::vector<RouteNode> nodes, int tiling = 1);

    std::size_t size() const { return nodes_.size(); }
    const RouteNode& node(std::size_t i) const { return nodes_[i]; }
    const std::vector<RouteNode>& nodes() const { return nodes_; }

    /**
     * @brief Number of laps the route was tiled into.
     */
    int tiling() const { return tiling_; }

    /**
     * @brief Total route length in meters (all laps).
     */
    double length_m() const { return nodes_.back().distance_m; }

    /**
     * @brief Heading from node i to node i+1 as an azimuth in degrees.
     */
    double bearing_deg(std::size_t i) const { return bearings_[i]; }

    /**
     * @brief Midpoint distances between consecutive nodes (size() - 1 entries).
     *
     * A distance d is closest to node i when midpoints[i-1] <= d < midpoints[i].
     */
    const std::vector<double>& segment_midpoints() const { return midpoints_; }

    /**
     * @brief Per-metre speed limit table.
     *
     * Entry k holds the limit in force at distance k meters, which is the
     * limit of the last node at or before k.
     */
    std::vector<double> speed_limit_table() const;

private:
    std::vector<RouteNode> nodes_;
    std::vector<double> bearings_;
    std::vector<double> midpoints_;
    int tiling_ = 1;
};

} // namespace sim
} // namespace helio

#endif // HELIOSTRATEGY_ROUTE_H
