#ifndef HELIOSTRATEGY_PHYSICS_TYPES_H
#define HELIOSTRATEGY_PHYSICS_TYPES_H

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

namespace helio {
namespace physics {

/**
 * @brief Vehicle-wide parameters that do not belong to a single component.
 */
struct VehicleParams {
    double mass_kg = 350.0;               ///< Vehicle mass in kg, driver included
    double max_acceleration_mps2 = 1.5;   ///< Maximum acceleration in m/s^2
    double max_deceleration_mps2 = 3.0;   ///< Maximum deceleration in m/s^2

    bool is_valid() const {
        return mass_kg > 0.0 &&
               max_acceleration_mps2 > 0.0 &&
               max_deceleration_mps2 > 0.0;
    }
};

/**
 * @brief Solar array parameters.
 */
struct ArrayParams {
    double panel_efficiency = 0.2432;     ///< Irradiance to electrical power, 0-1
    double panel_size_m2 = 4.0;           ///< Effective panel area in m^2

    bool is_valid() const {
        return panel_efficiency >= 0.0 && panel_efficiency <= 1.0 &&
               panel_size_m2 >= 0.0;
    }
};

/**
 * @brief Low-voltage system parameters (constant draw while driving).
 */
struct LVSParams {
    double voltage_v = 12.0;
    double current_a = 1.5;

    bool is_valid() const { return voltage_v >= 0.0 && current_a >= 0.0; }
};

/**
 * @brief Parameters shared by all motor models.
 */
struct BasicMotorParams {
    double road_friction = 0.0055;        ///< Rolling resistance coefficient
    double tire_radius_m = 0.2032;        ///< Tire radius in m
    double frontal_area_m2 = 1.15;        ///< Vehicle frontal area in m^2
    double drag_coefficient = 0.11;       ///< Aerodynamic drag coefficient Cd

    bool is_valid() const {
        return road_friction >= 0.0 && road_friction <= 0.5 &&
               tire_radius_m > 0.0 &&
               frontal_area_m2 > 0.0 &&
               drag_coefficient >= 0.0 && drag_coefficient <= 2.0;
    }
};

/**
 * @brief Motor model that additionally accounts for tire scrub in corners.
 */
struct AdvancedMotorParams : BasicMotorParams {
    double cornering_coefficient = 0.05;  ///< Fraction of lateral force lost as drag

    bool is_valid() const {
        return BasicMotorParams::is_valid() && cornering_coefficient >= 0.0;
    }
};

using MotorParams = std::variant<BasicMotorParams, AdvancedMotorParams>;

/**
 * @brief Regenerative braking parameters.
 */
struct RegenParams {
    double efficiency = 0.5;              ///< Fraction of lost mechanical energy recovered
    double min_speed_mps = 0.0;           ///< Regen is disabled below this speed
    double max_energy_per_tick_j = 10000.0;

    bool is_valid() const {
        return efficiency >= 0.0 && efficiency <= 1.0 &&
               min_speed_mps >= 0.0 && max_energy_per_tick_j >= 0.0;
    }
};

/**
 * @brief Datasheet battery model: linear voltage over depth of discharge.
 */
struct BasicBatteryParams {
    double max_voltage_v = 117.6;
    double min_voltage_v = 70.0;
    double max_current_capacity_ah = 48.75;
    double max_energy_capacity_wh = 4467.0;

    bool is_valid() const {
        return max_voltage_v > min_voltage_v && min_voltage_v >= 0.0 &&
               max_current_capacity_ah > 0.0 && max_energy_capacity_wh > 0.0;
    }
};

/**
 * @brief First-order Thevenin equivalent circuit battery model.
 *
 * R0, Rp, Cp and open-circuit voltage are tabulated against state of charge
 * and interpolated linearly.
 */
struct TheveninBatteryParams {
    std::vector<double> soc_data;         ///< Strictly increasing SOC samples, 0-1
    std::vector<double> uoc_data;         ///< Open-circuit voltage (V)
    std::vector<double> r0_data;          ///< Ohmic resistance (Ohm)
    std::vector<double> rp_data;          ///< Polarization resistance (Ohm)
    std::vector<double> cp_data;          ///< Polarization capacitance (F)
    double q_total_ah = 48.75;            ///< Total charge capacity (Ah)

    bool is_valid() const {
        const std::size_t n = soc_data.size();
        if (n < 2 || uoc_data.size() != n || r0_data.size() != n ||
            rp_data.size() != n || cp_data.size() != n || q_total_ah <= 0.0) {
            return false;
        }
        return std::adjacent_find(soc_data.begin(), soc_data.end(),
                                  [](double a, double b) { return b <= a; }) == soc_data.end();
    }
};

using BatteryParams = std::variant<BasicBatteryParams, TheveninBatteryParams>;

/**
 * @brief Complete, immutable description of a car for one simulation run.
 */
struct CarConfig {
    std::string name = "default";
    VehicleParams vehicle;
    ArrayParams array;
    LVSParams lvs;
    MotorParams motor = BasicMotorParams{};
    RegenParams regen;
    BatteryParams battery = BasicBatteryParams{};

    bool is_valid() const {
        const bool motor_ok = std::visit([](const auto& m) { return m.is_valid(); }, motor);
        const bool battery_ok = std::visit([](const auto& b) { return b.is_valid(); }, battery);
        return vehicle.is_valid() && array.is_valid() && lvs.is_valid() &&
               regen.is_valid() && motor_ok && battery_ok;
    }
};

} // namespace physics
} // namespace helio

#endif // HELIOSTRATEGY_PHYSICS_TYPES_H
