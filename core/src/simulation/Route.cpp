#include "simulation/Route.h"
#include "physics/PhysicsMath.h"
#include "utils/Errors.h"

#include <cmath>
#include <string>

namespace helio {
namespace sim {

Route::Route(std::vector<RouteNode> nodes, int tiling) : tiling_(tiling) {
    if (nodes.empty()) {
        throw PreconditionError("Route must contain at least one node");
    }
    if (tiling < 1) {
        throw PreconditionError("Route tiling must be >= 1, got " + std::to_string(tiling));
    }
    for (std::size_t i = 1; i < nodes.size(); ++i) {
        if (nodes[i].distance_m < nodes[i - 1].distance_m) {
            throw PreconditionError("Route distances decrease at node " + std::to_string(i));
        }
    }

    // Laps are joined through the closing segment from the last node back to the first
    const RouteNode& first = nodes.front();
    const RouteNode& last = nodes.back();
    double closing_gap = physics::calc_haversine_distance(
        last.latitude_deg, last.longitude_deg, first.latitude_deg, first.longitude_deg);
    double lap_length = (last.distance_m - first.distance_m) + closing_gap;

    nodes_.reserve(nodes.size() * static_cast<std::size_t>(tiling));
    for (int lap = 0; lap < tiling; ++lap) {
        for (const auto& n : nodes) {
            RouteNode copy = n;
            copy.distance_m = (n.distance_m - first.distance_m) + lap * lap_length;
            nodes_.push_back(copy);
        }
    }

    bearings_.resize(nodes_.size(), 0.0);
    for (std::size_t i = 0; i + 1 < nodes_.size(); ++i) {
        bearings_[i] = physics::calc_bearing_deg(
            nodes_[i].latitude_deg, nodes_[i].longitude_deg,
            nodes_[i + 1].latitude_deg, nodes_[i + 1].longitude_deg);
    }
    if (nodes_.size() > 1) {
        bearings_.back() = bearings_[nodes_.size() - 2];
    }

    midpoints_.reserve(nodes_.size() > 0 ? nodes_.size() - 1 : 0);
    for (std::size_t i = 0; i + 1 < nodes_.size(); ++i) {
        midpoints_.push_back(0.5 * (nodes_[i].distance_m + nodes_[i + 1].distance_m));
    }
}

std::vector<double> Route::speed_limit_table() const {
    std::size_t metres = static_cast<std::size_t>(std::ceil(length_m())) + 1;
    std::vector<double> table(metres, nodes_.front().speed_limit_kmh);

    std::size_t node = 0;
    for (std::size_t k = 0; k < metres; ++k) {
        while (node + 1 < nodes_.size() && nodes_[node + 1].distance_m <= static_cast<double>(k)) {
            ++node;
        }
        table[k] = nodes_[node].speed_limit_kmh;
    }
    return table;
}

} // namespace sim
} // namespace helio
