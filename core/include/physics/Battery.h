#ifndef HELIOSTRATEGY_BATTERY_H
#define HELIOSTRATEGY_BATTERY_H

#include "physics/Types.h"

#include <memory>

namespace helio {
namespace physics {

/**
 * @brief Capability interface for anything that stores electrical energy.
 *
 * update() applies one tick of net energy flow: positive charges, negative
 * discharges. The raw state of charge is never clamped below zero so a
 * stranded vehicle stays visible; state_of_charge() is the [0, 1] view.
 */
class EnergyStorage {
public:
    virtual ~EnergyStorage() = default;

    virtual void update(double delta_energy_j, double dt_s) = 0;

    virtual double state_of_charge() const = 0;
    virtual double raw_state_of_charge() const = 0;
    virtual double voltage() const = 0;
    virtual double stored_energy_j() const = 0;
    virtual double capacity_j() const = 0;

    bool is_exhausted() const { return raw_state_of_charge() < 0.0; }
};

/**
 * @brief Datasheet pack: voltage falls linearly with depth of discharge.
 */
class BasicBattery : public EnergyStorage {
public:
    BasicBattery(const BasicBatteryParams& params, double initial_soc);

    void update(double delta_energy_j, double dt_s) override;

    double state_of_charge() const override;
    double raw_state_of_charge() const override;
    double voltage() const override;
    double stored_energy_j() const override { return stored_energy_j_; }
    double capacity_j() const override { return capacity_j_; }

    /**
     * @brief Charge removed from a full pack (Ah).
     */
    double depth_of_discharge_ah() const;

private:
    BasicBatteryParams params_;
    double capacity_j_;
    double stored_energy_j_;
};

/**
 * @brief First-order Thevenin equivalent circuit (R0 + Rp||Cp).
 */
class TheveninBattery : public EnergyStorage {
public:
    TheveninBattery(const TheveninBatteryParams& params, double initial_soc);

    void update(double delta_energy_j, double dt_s) override;

    double state_of_charge() const override;
    double raw_state_of_charge() const override { return soc_; }
    double voltage() const override { return terminal_voltage_; }
    double stored_energy_j() const override { return soc_ * capacity_j_; }
    double capacity_j() const override { return capacity_j_; }

    double open_circuit_voltage() const;
    double polarization_voltage() const { return polarization_voltage_; }
    double current() const { return current_a_; }

private:
    TheveninBatteryParams params_;
    double capacity_j_;
    double soc_;
    double polarization_voltage_ = 0.0;
    double current_a_ = 0.0;
    double terminal_voltage_;
};

/**
 * @brief Resolve a battery variant into its model.
 * @throws PreconditionError if the parameters are invalid or initial_soc is outside [0, 1].
 */
std::unique_ptr<EnergyStorage> make_battery(const BatteryParams& params, double initial_soc);

} // namespace physics
} // namespace helio

#endif // HELIOSTRATEGY_BATTERY_H
