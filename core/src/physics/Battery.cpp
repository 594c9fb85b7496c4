#include "physics/Battery.h"
#include "physics/PhysicsMath.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <variant>

namespace helio {
namespace physics {

// ============================================================================
// BasicBattery
// ============================================================================

BasicBattery::BasicBattery(const BasicBatteryParams& params, double initial_soc)
    : params_(params)
    , capacity_j_(wh_to_joules(params.max_energy_capacity_wh))
    , stored_energy_j_(initial_soc * capacity_j_) {
}

void BasicBattery::update(double delta_energy_j, double /*dt_s*/) {
    // Charging stops at capacity; discharge is allowed to go below zero
    stored_energy_j_ = std::min(stored_energy_j_ + delta_energy_j, capacity_j_);
}

double BasicBattery::raw_state_of_charge() const {
    return stored_energy_j_ / capacity_j_;
}

double BasicBattery::state_of_charge() const {
    return std::clamp(raw_state_of_charge(), 0.0, 1.0);
}

double BasicBattery::depth_of_discharge_ah() const {
    return params_.max_current_capacity_ah * (1.0 - state_of_charge());
}

double BasicBattery::voltage() const {
    double k = (params_.max_voltage_v - params_.min_voltage_v) / params_.max_current_capacity_ah;
    return params_.max_voltage_v - k * depth_of_discharge_ah();
}

// ============================================================================
// TheveninBattery
// ============================================================================

TheveninBattery::TheveninBattery(const TheveninBatteryParams& params, double initial_soc)
    : params_(params)
    , soc_(initial_soc) {
    double max_uoc = *std::max_element(params_.uoc_data.begin(), params_.uoc_data.end());
    capacity_j_ = params_.q_total_ah * PhysicsConstants::SECONDS_PER_HOUR * max_uoc;
    terminal_voltage_ = open_circuit_voltage();
}

double TheveninBattery::state_of_charge() const {
    return std::clamp(soc_, 0.0, 1.0);
}

double TheveninBattery::open_circuit_voltage() const {
    return interpolate_linear(params_.soc_data, params_.uoc_data, state_of_charge());
}

void TheveninBattery::update(double delta_energy_j, double dt_s) {
    if (dt_s <= 0.0) {
        return;
    }

    double soc = state_of_charge();
    double uoc = open_circuit_voltage();
    double r0 = interpolate_linear(params_.soc_data, params_.r0_data, soc);
    double rp = interpolate_linear(params_.soc_data, params_.rp_data, soc);
    double cp = interpolate_linear(params_.soc_data, params_.cp_data, soc);

    // Discharge current is positive
    double power_w = -delta_energy_j / dt_s;
    current_a_ = (uoc > 0.0) ? power_w / uoc : 0.0;

    double tau = rp * cp;
    if (tau > 0.0) {
        double decay = std::exp(-dt_s / tau);
        polarization_voltage_ = polarization_voltage_ * decay + rp * current_a_ * (1.0 - decay);
    } else {
        polarization_voltage_ = rp * current_a_;
    }

    soc_ -= current_a_ * dt_s / (params_.q_total_ah * PhysicsConstants::SECONDS_PER_HOUR);
    soc_ = std::min(soc_, 1.0);

    terminal_voltage_ = open_circuit_voltage() - polarization_voltage_ - current_a_ * r0;
}

// ============================================================================
// Variant dispatch
// ============================================================================

namespace {

struct BatteryFactory {
    double initial_soc;

    std::unique_ptr<EnergyStorage> operator()(const BasicBatteryParams& p) const {
        return std::make_unique<BasicBattery>(p, initial_soc);
    }

    std::unique_ptr<EnergyStorage> operator()(const TheveninBatteryParams& p) const {
        return std::make_unique<TheveninBattery>(p, initial_soc);
    }
};

} // anonymous namespace

std::unique_ptr<EnergyStorage> make_battery(const BatteryParams& params, double initial_soc) {
    if (!(initial_soc >= 0.0 && initial_soc <= 1.0)) {
        throw PreconditionError("Initial state of charge must lie in [0, 1]");
    }
    bool valid = std::visit([](const auto& p) { return p.is_valid(); }, params);
    if (!valid) {
        throw PreconditionError("Invalid battery parameters");
    }
    return std::visit(BatteryFactory{initial_soc}, params);
}

} // namespace physics
} // namespace helio
