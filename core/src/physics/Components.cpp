#include "physics/Components.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <variant>

namespace helio {
namespace physics {

// ============================================================================
// Motor
// ============================================================================

Motor::Motor(const BasicMotorParams& params, double mass_kg, const Atmosphere& atmosphere,
             double cornering_coefficient)
    : params_(params)
    , mass_kg_(mass_kg)
    , atmosphere_(atmosphere)
    , cornering_coefficient_(cornering_coefficient) {
}

double Motor::traction_force(const TickConditions& tick) const {
    double angle = gradient_to_angle(tick.gradient);

    double rolling = calc_rolling_resistance_force(
        mass_kg_, params_.road_friction, angle, atmosphere_.gravity);
    double grade = calc_grade_resistance_force(mass_kg_, angle, atmosphere_.gravity);
    double drag = calc_drag_force(
        tick.speed_mps + tick.headwind_mps,
        params_.drag_coefficient,
        params_.frontal_area_m2,
        atmosphere_.air_density);

    // Braking is handled by regen, only acceleration costs traction
    double acceleration = 0.0;
    if (tick.dt_s > 0.0) {
        acceleration = std::max(0.0, (tick.speed_mps - tick.previous_speed_mps) / tick.dt_s);
    }
    double accel_force = mass_kg_ * acceleration;

    double cornering = 0.0;
    if (std::abs(tick.curvature) > PhysicsConstants::MIN_CURVATURE) {
        double lateral_force = mass_kg_ * tick.speed_mps * tick.speed_mps * std::abs(tick.curvature);
        cornering = cornering_coefficient_ * lateral_force;
    }

    return rolling + grade + drag + accel_force + cornering;
}

double Motor::output_energy(const TickConditions& tick) const {
    // ω * F * r * dt, with ω = v / r
    double angular_speed = tick.speed_mps / params_.tire_radius_m;
    double energy = angular_speed * traction_force(tick) * params_.tire_radius_m * tick.dt_s;
    return std::max(0.0, energy);
}

double Motor::consumed_energy(const TickConditions& tick) const {
    double out = output_energy(tick);
    if (out <= 0.0 || tick.dt_s <= 0.0) {
        return 0.0;
    }

    double angular_speed = tick.speed_mps / params_.tire_radius_m;
    double output_power = out / tick.dt_s;
    double rpm = angular_speed * 30.0 / PhysicsConstants::PI;
    double torque = (angular_speed > 0.0) ? output_power / angular_speed : 0.0;

    double e_m = motor_efficiency(output_power, rpm);
    double e_mc = controller_efficiency(angular_speed, torque);

    return out / (e_m * e_mc);
}

double Motor::motor_efficiency(double output_power_w, double rpm) {
    const double p = output_power_w;
    const double n = rpm;

    // Fit to the NGM SC-M150 datasheet
    double e = 0.7382 - 6.281e-5 * p + 6.708e-4 * n
               - 2.89e-8 * p * p + 2.416e-7 * p * n - 8.672e-7 * n * n
               + 5.653e-12 * p * p * p - 1.74e-11 * p * p * n
               - 7.322e-11 * p * n * n + 3.263e-10 * n * n * n;

    return std::clamp(e, 0.7382, 1.0);
}

double Motor::controller_efficiency(double angular_speed_rads, double torque_nm) {
    const double w = angular_speed_rads;
    const double t = torque_nm;

    // Fit to the WaveSculptor efficiency curve at a 90 V bus
    double e = 0.7694 + 0.007818 * w + 0.007043 * t
               - 1.658e-4 * w * w - 1.806e-5 * t * w - 1.909e-4 * t * t
               + 1.602e-6 * w * w * w + 4.236e-7 * w * w * t
               - 2.306e-7 * w * t * t + 2.122e-6 * t * t * t
               - 5.701e-9 * w * w * w * w - 2.054e-9 * w * w * w * t
               - 3.126e-10 * w * w * t * t + 1.708e-9 * w * t * t * t
               - 8.094e-9 * t * t * t * t;

    return std::clamp(e, 0.9, 1.0);
}

namespace {

struct MotorFactory {
    double mass_kg;
    Atmosphere atmosphere;

    std::unique_ptr<Motor> operator()(const BasicMotorParams& p) const {
        return std::make_unique<Motor>(p, mass_kg, atmosphere);
    }

    std::unique_ptr<Motor> operator()(const AdvancedMotorParams& p) const {
        return std::make_unique<Motor>(p, mass_kg, atmosphere, p.cornering_coefficient);
    }
};

} // anonymous namespace

std::unique_ptr<Motor> make_motor(const MotorParams& params, double mass_kg,
                                  const Atmosphere& atmosphere) {
    bool valid = std::visit([](const auto& p) { return p.is_valid(); }, params);
    if (!valid || mass_kg <= 0.0) {
        throw PreconditionError("Invalid motor parameters");
    }
    return std::visit(MotorFactory{mass_kg, atmosphere}, params);
}

// ============================================================================
// Array, LVS, Regen
// ============================================================================

double SolarArray::produced_energy(const TickConditions& tick) const {
    double irradiance = std::max(0.0, tick.irradiance_wm2);
    return irradiance * params_.panel_efficiency * params_.panel_size_m2 * tick.dt_s;
}

double LowVoltageSystem::consumed_energy(const TickConditions& tick) const {
    return params_.voltage_v * params_.current_a * tick.dt_s;
}

RegenBrake::RegenBrake(const RegenParams& params, double mass_kg, double gravity)
    : params_(params)
    , mass_kg_(mass_kg)
    , gravity_(gravity) {
}

double RegenBrake::produced_energy(const TickConditions& tick) const {
    if (tick.previous_speed_mps < params_.min_speed_mps || tick.previous_speed_mps <= 0.0) {
        return 0.0;
    }

    double delta_kinetic = 0.5 * mass_kg_ *
        (tick.speed_mps * tick.speed_mps - tick.previous_speed_mps * tick.previous_speed_mps);
    double delta_potential = mass_kg_ * gravity_ * (tick.elevation_m - tick.previous_elevation_m);
    double delta = delta_kinetic + delta_potential;

    if (delta >= 0.0) {
        return 0.0;
    }
    return std::min(std::abs(delta) * params_.efficiency, params_.max_energy_per_tick_j);
}

} // namespace physics
} // namespace helio
