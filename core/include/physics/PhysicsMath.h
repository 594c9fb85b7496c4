#ifndef HELIOSTRATEGY_PHYSICS_MATH_H
#define HELIOSTRATEGY_PHYSICS_MATH_H

#include <cmath>
#include <vector>

namespace helio {
namespace physics {

/**
 * @brief Default constants for physics calculations.
 */
struct PhysicsConstants {
    static constexpr double EARTH_GRAVITY = 9.81;           ///< m/s^2
    static constexpr double AIR_DENSITY_SEA_LEVEL = 1.225;  ///< kg/m^3, 15C and 101 kPa
    static constexpr double EARTH_RADIUS_M = 6371009.0;     ///< Mean Earth radius (m)
    static constexpr double SECONDS_PER_HOUR = 3600.0;
    static constexpr double SECONDS_PER_DAY = 86400.0;
    static constexpr double MIN_CURVATURE = 1.0e-9;         ///< 1/m - below this, treat as straight
    static constexpr double PI = 3.14159265358979323846;
};

/**
 * @brief Calculate rolling resistance force on a slope.
 * @param mass Vehicle mass (kg).
 * @param rolling_coeff Rolling resistance coefficient (dimensionless).
 * @param grade_angle Slope angle in radians.
 * @param gravity Gravitational acceleration (m/s^2).
 * @return Rolling resistance force (N).
 *
 * Formula: F_roll = Crr * m * g * cos(θ)
 */
inline double calc_rolling_resistance_force(
    double mass,
    double rolling_coeff,
    double grade_angle = 0.0,
    double gravity = PhysicsConstants::EARTH_GRAVITY
) {
    return rolling_coeff * mass * gravity * std::cos(grade_angle);
}

/**
 * @brief Calculate aerodynamic drag force.
 * @param air_speed Air speed relative to the vehicle (m/s); negative for a net tailwind.
 * @param drag_coeff Drag coefficient (dimensionless).
 * @param frontal_area Frontal area (m^2).
 * @param air_density Air density (kg/m^3).
 * @return Drag force (N), negative when the air pushes the vehicle forward.
 *
 * Formula: F_drag = 0.5 * ρ * Cd * A * v * |v|
 */
inline double calc_drag_force(
    double air_speed,
    double drag_coeff,
    double frontal_area,
    double air_density = PhysicsConstants::AIR_DENSITY_SEA_LEVEL
) {
    return 0.5 * air_density * drag_coeff * frontal_area * air_speed * std::abs(air_speed);
}

/**
 * @brief Calculate grade/slope resistance force.
 * @param mass Vehicle mass (kg).
 * @param grade_angle Slope angle in radians (positive = uphill).
 * @param gravity Gravitational acceleration (m/s^2).
 * @return Grade resistance force (N), positive when going uphill.
 */
inline double calc_grade_resistance_force(
    double mass,
    double grade_angle,
    double gravity = PhysicsConstants::EARTH_GRAVITY
) {
    return mass * gravity * std::sin(grade_angle);
}

/**
 * @brief Convert a road gradient (rise over run) to a slope angle in radians.
 */
inline double gradient_to_angle(double gradient) {
    return std::atan(gradient);
}

/**
 * @brief Wind component blowing against the direction of travel.
 * @param wind_speed Absolute wind speed (m/s).
 * @param wind_direction_deg Wind direction, meteorological convention (where it blows from).
 * @param bearing_deg Vehicle heading as an azimuth in degrees.
 * @return Headwind speed (m/s); negative for a tailwind.
 */
double calc_headwind_speed(double wind_speed, double wind_direction_deg, double bearing_deg);

/**
 * @brief Great-circle distance between two coordinates (haversine).
 * @return Distance in meters.
 */
double calc_haversine_distance(double lat1_deg, double lon1_deg,
                               double lat2_deg, double lon2_deg);

/**
 * @brief Initial bearing from one coordinate to another.
 * @return Azimuth in degrees, [0, 360).
 */
double calc_bearing_deg(double lat1_deg, double lon1_deg,
                        double lat2_deg, double lon2_deg);

/**
 * @brief Piecewise-linear interpolation of (xs, ys) at x.
 *
 * xs must be strictly increasing. Values outside the table are clamped to
 * the first/last sample.
 */
double interpolate_linear(const std::vector<double>& xs,
                          const std::vector<double>& ys,
                          double x);

inline double deg_to_rad(double deg) { return deg * PhysicsConstants::PI / 180.0; }
inline double rad_to_deg(double rad) { return rad * 180.0 / PhysicsConstants::PI; }

/**
 * @brief Convert speed from m/s to km/h.
 */
inline double mps_to_kmph(double mps) {
    return mps * 3.6;
}

/**
 * @brief Convert speed from km/h to m/s.
 */
inline double kmph_to_mps(double kmph) {
    return kmph / 3.6;
}

inline double joules_to_wh(double joules) {
    return joules / PhysicsConstants::SECONDS_PER_HOUR;
}

inline double wh_to_joules(double wh) {
    return wh * PhysicsConstants::SECONDS_PER_HOUR;
}

} // namespace physics
} // namespace helio

#endif // HELIOSTRATEGY_PHYSICS_MATH_H
