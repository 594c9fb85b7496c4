#ifndef HELIOSTRATEGY_COMPONENTS_H
#define HELIOSTRATEGY_COMPONENTS_H

#include "physics/PhysicsMath.h"
#include "physics/Types.h"

#include <memory>

namespace helio {
namespace physics {

/**
 * @brief Instantaneous inputs shared by all component models for one tick.
 */
struct TickConditions {
    double speed_mps = 0.0;
    double previous_speed_mps = 0.0;
    double gradient = 0.0;                ///< Rise over run, > 0 uphill
    double elevation_m = 0.0;
    double previous_elevation_m = 0.0;
    double headwind_mps = 0.0;            ///< Wind against the direction of travel
    double irradiance_wm2 = 0.0;          ///< Global horizontal irradiance
    double curvature = 0.0;               ///< 1/m
    double dt_s = 1.0;
};

/**
 * @brief Ambient constants used by the force models.
 */
struct Atmosphere {
    double gravity = PhysicsConstants::EARTH_GRAVITY;
    double air_density = PhysicsConstants::AIR_DENSITY_SEA_LEVEL;
};

/**
 * @brief Capability interface for components that draw energy.
 */
class EnergyConsumer {
public:
    virtual ~EnergyConsumer() = default;

    /**
     * @return Energy drawn from the battery during the tick (J), >= 0.
     */
    virtual double consumed_energy(const TickConditions& tick) const = 0;
};

/**
 * @brief Capability interface for components that supply energy.
 */
class EnergyProducer {
public:
    virtual ~EnergyProducer() = default;

    /**
     * @return Energy delivered to the battery during the tick (J), >= 0.
     */
    virtual double produced_energy(const TickConditions& tick) const = 0;
};

/**
 * @brief In-wheel motor and motor controller.
 *
 * Traction force is the sum of rolling resistance, grade, aerodynamic drag
 * (including headwind), the force needed to accelerate and, for the advanced
 * model, cornering scrub. Output energy is divided by the motor and
 * controller efficiencies taken from fitted datasheet curves.
 */
class Motor : public EnergyConsumer {
public:
    Motor(const BasicMotorParams& params, double mass_kg, const Atmosphere& atmosphere,
          double cornering_coefficient = 0.0);

    double consumed_energy(const TickConditions& tick) const override;

    /**
     * @brief Mechanical energy delivered to the wheels (J), >= 0.
     */
    double output_energy(const TickConditions& tick) const;

    /**
     * @brief Net traction force required at the wheel (N).
     */
    double traction_force(const TickConditions& tick) const;

    /**
     * @brief Motor efficiency from output power (W) and speed (rpm), clipped to [0.7382, 1].
     */
    static double motor_efficiency(double output_power_w, double rpm);

    /**
     * @brief Controller efficiency from angular speed (rad/s) and torque (Nm), clipped to [0.9, 1].
     */
    static double controller_efficiency(double angular_speed_rads, double torque_nm);

    double cornering_coefficient() const { return cornering_coefficient_; }

private:
    BasicMotorParams params_;
    double mass_kg_;
    Atmosphere atmosphere_;
    double cornering_coefficient_;
};

/**
 * @brief Resolve a motor variant into its model.
 */
std::unique_ptr<Motor> make_motor(const MotorParams& params, double mass_kg,
                                  const Atmosphere& atmosphere);

class SolarArray : public EnergyProducer {
public:
    explicit SolarArray(const ArrayParams& params) : params_(params) {}

    double produced_energy(const TickConditions& tick) const override;

private:
    ArrayParams params_;
};

class LowVoltageSystem : public EnergyConsumer {
public:
    explicit LowVoltageSystem(const LVSParams& params) : params_(params) {}

    double consumed_energy(const TickConditions& tick) const override;

private:
    LVSParams params_;
};

/**
 * @brief Regenerative braking.
 *
 * Recovers a fraction of any drop in kinetic plus potential energy between
 * consecutive ticks, provided the car was moving at least min_speed_mps,
 * capped per tick.
 */
class RegenBrake : public EnergyProducer {
public:
    RegenBrake(const RegenParams& params, double mass_kg, double gravity);

    double produced_energy(const TickConditions& tick) const override;

private:
    RegenParams params_;
    double mass_kg_;
    double gravity_;
};

} // namespace physics
} // namespace helio

#endif // HELIOSTRATEGY_COMPONENTS_H
