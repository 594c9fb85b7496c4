#include "physics/PhysicsMath.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace helio {
namespace physics {

double calc_headwind_speed(double wind_speed, double wind_direction_deg, double bearing_deg) {
    // Meteorological direction is where the wind comes from, so a wind from
    // the vehicle's heading (difference 0) opposes motion fully.
    return wind_speed * std::cos(deg_to_rad(wind_direction_deg - bearing_deg));
}

double calc_haversine_distance(double lat1_deg, double lon1_deg,
                               double lat2_deg, double lon2_deg) {
    double phi1 = deg_to_rad(lat1_deg);
    double phi2 = deg_to_rad(lat2_deg);
    double d_phi = deg_to_rad(lat2_deg - lat1_deg);
    double d_lambda = deg_to_rad(lon2_deg - lon1_deg);

    double a = std::sin(d_phi / 2.0) * std::sin(d_phi / 2.0) +
               std::cos(phi1) * std::cos(phi2) *
               std::sin(d_lambda / 2.0) * std::sin(d_lambda / 2.0);
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return PhysicsConstants::EARTH_RADIUS_M * c;
}

double calc_bearing_deg(double lat1_deg, double lon1_deg,
                        double lat2_deg, double lon2_deg) {
    double phi1 = deg_to_rad(lat1_deg);
    double phi2 = deg_to_rad(lat2_deg);
    double d_lambda = deg_to_rad(lon2_deg - lon1_deg);

    double y = std::sin(d_lambda) * std::cos(phi2);
    double x = std::cos(phi1) * std::sin(phi2) -
               std::sin(phi1) * std::cos(phi2) * std::cos(d_lambda);

    double bearing = std::fmod(rad_to_deg(std::atan2(y, x)) + 360.0, 360.0);
    return bearing;
}

double interpolate_linear(const std::vector<double>& xs,
                          const std::vector<double>& ys,
                          double x) {
    if (xs.empty() || xs.size() != ys.size()) {
        throw std::invalid_argument("interpolate_linear: table sizes do not match");
    }
    if (x <= xs.front()) return ys.front();
    if (x >= xs.back()) return ys.back();

    auto upper = std::upper_bound(xs.begin(), xs.end(), x);
    std::size_t hi = static_cast<std::size_t>(upper - xs.begin());
    std::size_t lo = hi - 1;

    double t = (x - xs[lo]) / (xs[hi] - xs[lo]);
    return ys[lo] + t * (ys[hi] - ys[lo]);
}

} // namespace physics
} // namespace helio
