/**
 * @file test_config_physics.cpp
 * @brief GoogleTest suite for ConfigManager, VehicleLoader and the physics layer.
 *
 * Tests cover:
 * - Simulation parameter and race loading
 * - Vehicle preset loading (basic and Thevenin variants)
 * - Physics math helpers and solar geometry
 * - Battery charge/discharge behaviour
 * - Motor, array, LVS and regen component models
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <variant>
#include <vector>

#include "utils/ConfigManager.h"
#include "utils/Errors.h"
#include "physics/Battery.h"
#include "physics/Components.h"
#include "physics/PhysicsMath.h"
#include "physics/SolarGeometry.h"
#include "physics/VehicleLoader.h"

namespace helio {
namespace testing {

// Tolerance for floating-point comparisons
constexpr double EPSILON = 1e-6;

// ============================================================================
// Test Fixture for ConfigManager Tests
// ============================================================================
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::instance().initialize(TEST_CONFIG_DIR);
    }
};

// ============================================================================
// Test 1: Simulation Config Parameters
// ============================================================================
TEST_F(ConfigManagerTest, SimConfig_GravityDefault) {
    double gravity = ConfigManager::instance().get_sim_param<double>("gravity");
    EXPECT_NEAR(gravity, 9.81, EPSILON);
}

TEST_F(ConfigManagerTest, SimConfig_AirDensity) {
    double air_density = ConfigManager::instance().get_sim_param<double>("air_density");
    EXPECT_NEAR(air_density, 1.225, EPSILON);
}

TEST_F(ConfigManagerTest, SimConfig_TickAndGranularity) {
    EXPECT_EQ(ConfigManager::instance().get_sim_param<int>("tick"), 1);
    EXPECT_EQ(ConfigManager::instance().get_sim_param<int>("granularity"), 1);
}

TEST_F(ConfigManagerTest, SimConfig_ExhaustionPolicy) {
    auto policy = ConfigManager::instance().get_sim_param<std::string>("exhaustion_policy");
    EXPECT_EQ(policy, "continue");
}

TEST_F(ConfigManagerTest, SimConfig_MissingParamThrows) {
    EXPECT_THROW(
        ConfigManager::instance().get_sim_param<double>("nonexistent_param"),
        std::runtime_error
    );
}

TEST_F(ConfigManagerTest, SimConfig_GetParamWithDefault) {
    double value = ConfigManager::instance().get_sim_param_or<double>("nonexistent", 42.0);
    EXPECT_NEAR(value, 42.0, EPSILON);
}

TEST_F(ConfigManagerTest, SimConfig_OptimizationSection) {
    YAML::Node section = ConfigManager::instance().get_section("optimization");
    ASSERT_TRUE(section.IsMap());
    EXPECT_EQ(section["population_size"].as<int>(), 20);
    EXPECT_EQ(section["crossover_type"].as<std::string>(), "single_point");
}

TEST_F(ConfigManagerTest, SimConfig_MissingSectionThrows) {
    EXPECT_THROW(ConfigManager::instance().get_section("no_such_section"), std::runtime_error);
    // A scalar is not a section
    EXPECT_THROW(ConfigManager::instance().get_section("gravity"), std::runtime_error);
}

// ============================================================================
// Test 2: Race constants
// ============================================================================
TEST_F(ConfigManagerTest, Races_ListIsSorted) {
    auto races = ConfigManager::instance().list_races();
    ASSERT_EQ(races.size(), 2u);
    EXPECT_EQ(races[0], "ASC");
    EXPECT_EQ(races[1], "FSGP");
}

TEST_F(ConfigManagerTest, Races_AscWindows) {
    auto asc = ConfigManager::instance().get_race("ASC");
    ASSERT_TRUE(asc.has_value());
    EXPECT_EQ(asc->start_year, 2024);
    EXPECT_EQ(asc->start_month, 7);
    EXPECT_EQ(asc->start_day, 20);
    ASSERT_EQ(asc->days.size(), 8u);
    EXPECT_EQ(asc->days[0].driving_begin, 32400);
    EXPECT_EQ(asc->days[0].driving_end, 64800);
    EXPECT_EQ(asc->days[7].driving_end, 61200);
}

TEST_F(ConfigManagerTest, Races_FsgpTiling) {
    auto fsgp = ConfigManager::instance().get_race("FSGP");
    ASSERT_TRUE(fsgp.has_value());
    EXPECT_EQ(fsgp->tiling, 100);
    EXPECT_EQ(fsgp->days.size(), 3u);
}

TEST_F(ConfigManagerTest, Races_UnknownRace) {
    EXPECT_FALSE(ConfigManager::instance().get_race("WSC").has_value());
}

// ============================================================================
// Test 3: Vehicle presets
// ============================================================================
class VehicleLoaderTest : public ::testing::Test {
protected:
    physics::VehicleLoader loader{std::string(TEST_CONFIG_DIR) + "/vehicle_presets"};
};

TEST_F(VehicleLoaderTest, VehicleLoader_DefaultCar) {
    auto car = physics::VehicleLoader::get_default();
    EXPECT_EQ(car.name, "default_solar_car");
    EXPECT_TRUE(car.is_valid());
    EXPECT_TRUE(std::holds_alternative<physics::BasicMotorParams>(car.motor));
    EXPECT_TRUE(std::holds_alternative<physics::BasicBatteryParams>(car.battery));
}

TEST_F(VehicleLoaderTest, VehicleLoader_BasicPreset) {
    auto car = loader.load_preset("brightside.json");
    ASSERT_TRUE(car.has_value());
    EXPECT_EQ(car->name, "brightside");
    EXPECT_NEAR(car->vehicle.mass_kg, 350.0, EPSILON);
    EXPECT_NEAR(car->array.panel_efficiency, 0.2432, EPSILON);
    ASSERT_TRUE(std::holds_alternative<physics::BasicBatteryParams>(car->battery));
    EXPECT_NEAR(std::get<physics::BasicBatteryParams>(car->battery).max_energy_capacity_wh, 4467.0, EPSILON);
}

TEST_F(VehicleLoaderTest, VehicleLoader_TheveninPreset) {
    auto car = loader.load_preset("brightside_thevenin.json");
    ASSERT_TRUE(car.has_value());
    ASSERT_TRUE(std::holds_alternative<physics::AdvancedMotorParams>(car->motor));
    EXPECT_NEAR(std::get<physics::AdvancedMotorParams>(car->motor).cornering_coefficient, 0.05, EPSILON);
    ASSERT_TRUE(std::holds_alternative<physics::TheveninBatteryParams>(car->battery));
    EXPECT_EQ(std::get<physics::TheveninBatteryParams>(car->battery).soc_data.size(), 7u);
}

TEST_F(VehicleLoaderTest, VehicleLoader_ListAndLoadAll) {
    auto presets = loader.list_presets();
    EXPECT_NE(std::find(presets.begin(), presets.end(), "brightside.json"), presets.end());
    EXPECT_NE(std::find(presets.begin(), presets.end(), "brightside_thevenin.json"), presets.end());

    auto all = loader.load_all_presets();
    EXPECT_EQ(all.count("brightside"), 1u);
    EXPECT_EQ(all.count("brightside_thevenin"), 1u);
}

TEST_F(VehicleLoaderTest, VehicleLoader_MissingFile) {
    EXPECT_FALSE(loader.load_preset("does_not_exist.json").has_value());
}

TEST_F(VehicleLoaderTest, VehicleLoader_FromJsonString) {
    auto car = physics::VehicleLoader::from_json_string(R"({
        "name": "light",
        "vehicle": {"mass_kg": 250.0},
        "motor": {"motor_type": "advanced", "cornering_coefficient": 0.1}
    })");
    ASSERT_TRUE(car.has_value());
    EXPECT_EQ(car->name, "light");
    EXPECT_NEAR(car->vehicle.mass_kg, 250.0, EPSILON);
    EXPECT_TRUE(std::holds_alternative<physics::AdvancedMotorParams>(car->motor));
}

TEST_F(VehicleLoaderTest, VehicleLoader_InvalidJson) {
    EXPECT_FALSE(physics::VehicleLoader::from_json_string("{not json").has_value());
}

TEST_F(VehicleLoaderTest, VehicleLoader_UnknownBatteryType) {
    EXPECT_FALSE(physics::VehicleLoader::from_json_string(
        R"({"battery": {"battery_type": "lead_acid"}})").has_value());
}

TEST_F(VehicleLoaderTest, VehicleLoader_InvalidParameters) {
    EXPECT_FALSE(physics::VehicleLoader::from_json_string(
        R"({"vehicle": {"mass_kg": -10.0}})").has_value());
}

// ============================================================================
// Test 4: Physics Math
// ============================================================================
TEST(PhysicsMathTest, Headwind_FromHeading) {
    EXPECT_NEAR(physics::calc_headwind_speed(10.0, 90.0, 90.0), 10.0, EPSILON);
    EXPECT_NEAR(physics::calc_headwind_speed(10.0, 90.0, 270.0), -10.0, EPSILON);
    EXPECT_NEAR(physics::calc_headwind_speed(10.0, 0.0, 90.0), 0.0, EPSILON);
}

TEST(PhysicsMathTest, Haversine_OneDegreeOfLatitude) {
    double d = physics::calc_haversine_distance(0.0, 0.0, 1.0, 0.0);
    EXPECT_NEAR(d, 111195.0, 10.0);
}

TEST(PhysicsMathTest, Bearing_CardinalDirections) {
    EXPECT_NEAR(physics::calc_bearing_deg(0.0, 0.0, 1.0, 0.0), 0.0, 1e-6);
    EXPECT_NEAR(physics::calc_bearing_deg(0.0, 0.0, 0.0, 1.0), 90.0, 1e-6);
    EXPECT_NEAR(physics::calc_bearing_deg(0.0, 0.0, -1.0, 0.0), 180.0, 1e-6);
    EXPECT_NEAR(physics::calc_bearing_deg(0.0, 0.0, 0.0, -1.0), 270.0, 1e-6);
}

TEST(PhysicsMathTest, Interpolate_InsideAndClamped) {
    std::vector<double> xs = {0.0, 1.0, 2.0};
    std::vector<double> ys = {0.0, 10.0, 30.0};
    EXPECT_NEAR(physics::interpolate_linear(xs, ys, 0.25), 2.5, EPSILON);
    EXPECT_NEAR(physics::interpolate_linear(xs, ys, 1.5), 20.0, EPSILON);
    EXPECT_NEAR(physics::interpolate_linear(xs, ys, -1.0), 0.0, EPSILON);
    EXPECT_NEAR(physics::interpolate_linear(xs, ys, 5.0), 30.0, EPSILON);
}

TEST(PhysicsMathTest, Interpolate_SizeMismatchThrows) {
    EXPECT_THROW(physics::interpolate_linear({0.0, 1.0}, {0.0}, 0.5), std::invalid_argument);
}

TEST(PhysicsMathTest, DragForce_SignFollowsAirSpeed) {
    double head = physics::calc_drag_force(10.0, 0.11, 1.15);
    double tail = physics::calc_drag_force(-10.0, 0.11, 1.15);
    EXPECT_NEAR(head, 0.5 * 1.225 * 0.11 * 1.15 * 100.0, EPSILON);
    EXPECT_NEAR(tail, -head, EPSILON);
}

TEST(PhysicsMathTest, UnitConversions) {
    EXPECT_NEAR(physics::mps_to_kmph(10.0), 36.0, EPSILON);
    EXPECT_NEAR(physics::kmph_to_mps(36.0), 10.0, EPSILON);
    EXPECT_NEAR(physics::wh_to_joules(1.0), 3600.0, EPSILON);
    EXPECT_NEAR(physics::joules_to_wh(7200.0), 2.0, EPSILON);
}

// ============================================================================
// Test 5: Calendar and solar geometry
// ============================================================================
TEST(SolarGeometryTest, Calendar_DaysFromCivil) {
    EXPECT_EQ(physics::days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(physics::days_from_civil(2000, 3, 1), 11017);
    EXPECT_EQ(physics::days_from_civil(1969, 12, 31), -1);

    auto date = physics::civil_from_days(physics::days_from_civil(2024, 7, 20));
    EXPECT_EQ(date.year, 2024);
    EXPECT_EQ(date.month, 7);
    EXPECT_EQ(date.day, 20);
}

TEST(SolarGeometryTest, Calendar_DayOfYear) {
    EXPECT_EQ(physics::day_of_year(2023, 1, 1), 1);
    EXPECT_EQ(physics::day_of_year(2024, 3, 1), 61);   // leap year
    EXPECT_EQ(physics::day_of_year(2023, 3, 1), 60);
}

TEST(SolarGeometryTest, Irradiance_DarkAtMidnight) {
    int doy = physics::day_of_year(2024, 7, 20);
    double ghi = physics::SolarGeometry::global_horizontal_irradiance(39.0, -94.5, -5.0, doy, 0.0, 280.0);
    EXPECT_NEAR(ghi, 0.0, EPSILON);
}

TEST(SolarGeometryTest, Irradiance_StrongAtSummerNoon) {
    int doy = physics::day_of_year(2024, 7, 20);
    double ghi = physics::SolarGeometry::global_horizontal_irradiance(39.0, -94.5, -5.0, doy, 13.0, 280.0);
    EXPECT_GT(ghi, 700.0);
    EXPECT_LT(ghi, 1353.0);
}

TEST(SolarGeometryTest, Irradiance_SunriseBeforeSunset) {
    int doy = physics::day_of_year(2024, 7, 20);
    auto times = physics::SolarGeometry::sunrise_sunset(39.0, -94.5, -5.0, doy);
    EXPECT_GT(times.sunrise_hours, 4.0);
    EXPECT_LT(times.sunrise_hours, times.sunset_hours);
    EXPECT_LT(times.sunset_hours, 22.0);
}

TEST(SolarGeometryTest, CloudCover_Attenuation) {
    EXPECT_NEAR(physics::SolarGeometry::apply_cloud_cover(800.0, 0.0), 800.0, EPSILON);
    EXPECT_NEAR(physics::SolarGeometry::apply_cloud_cover(800.0, 100.0), 200.0, EPSILON);
    double half = physics::SolarGeometry::apply_cloud_cover(800.0, 50.0);
    EXPECT_GT(half, 200.0);
    EXPECT_LT(half, 800.0);
}

// ============================================================================
// Test 6: Battery
// ============================================================================
TEST(BatteryTest, Basic_DischargeFromHalfCharge) {
    auto battery = physics::make_battery(physics::BasicBatteryParams(), 0.5);
    double soc_before = battery->state_of_charge();
    double voltage_before = battery->voltage();

    battery->update(-50000.0, 1.0);

    EXPECT_LT(battery->state_of_charge(), soc_before);
    EXPECT_LT(battery->voltage(), voltage_before);
}

TEST(BatteryTest, Thevenin_DischargeFromHalfCharge) {
    auto car = physics::VehicleLoader(std::string(TEST_CONFIG_DIR) + "/vehicle_presets")
                   .load_preset("brightside_thevenin.json");
    ASSERT_TRUE(car.has_value());

    auto battery = physics::make_battery(car->battery, 0.5);
    double soc_before = battery->state_of_charge();
    double voltage_before = battery->voltage();

    battery->update(-5000.0, 1.0);

    EXPECT_LT(battery->state_of_charge(), soc_before);
    EXPECT_LT(battery->voltage(), voltage_before);
}

TEST(BatteryTest, Basic_ChargeStopsAtCapacity) {
    physics::BasicBattery battery(physics::BasicBatteryParams(), 0.99);
    battery.update(1.0e9, 1.0);
    EXPECT_NEAR(battery.raw_state_of_charge(), 1.0, EPSILON);
    EXPECT_NEAR(battery.voltage(), 117.6, EPSILON);
}

TEST(BatteryTest, Basic_ExhaustionKeepsRawSoc) {
    physics::BasicBattery battery(physics::BasicBatteryParams(), 0.01);
    battery.update(-battery.capacity_j() * 0.05, 1.0);
    EXPECT_TRUE(battery.is_exhausted());
    EXPECT_LT(battery.raw_state_of_charge(), 0.0);
    EXPECT_NEAR(battery.state_of_charge(), 0.0, EPSILON);
    EXPECT_NEAR(battery.voltage(), 70.0, EPSILON);
}

TEST(BatteryTest, Factory_RejectsBadInputs) {
    EXPECT_THROW(physics::make_battery(physics::BasicBatteryParams(), 1.5), PreconditionError);
    EXPECT_THROW(physics::make_battery(physics::TheveninBatteryParams(), 0.5), PreconditionError);
}

// ============================================================================
// Test 7: Component models
// ============================================================================
class ComponentTest : public ::testing::Test {
protected:
    physics::Atmosphere atmosphere;
    physics::BasicMotorParams motor_params;

    physics::TickConditions cruising(double speed_mps) const {
        physics::TickConditions tick;
        tick.speed_mps = speed_mps;
        tick.previous_speed_mps = speed_mps;
        tick.dt_s = 1.0;
        return tick;
    }
};

TEST_F(ComponentTest, Motor_StationaryUsesNothing) {
    physics::Motor motor(motor_params, 350.0, atmosphere);
    EXPECT_NEAR(motor.consumed_energy(cruising(0.0)), 0.0, EPSILON);
}

TEST_F(ComponentTest, Motor_ConsumedExceedsOutput) {
    physics::Motor motor(motor_params, 350.0, atmosphere);
    auto tick = cruising(15.0);
    double out = motor.output_energy(tick);
    EXPECT_GT(out, 0.0);
    EXPECT_GT(motor.consumed_energy(tick), out);
}

TEST_F(ComponentTest, Motor_UphillAndHeadwindCostMore) {
    physics::Motor motor(motor_params, 350.0, atmosphere);
    auto flat = cruising(15.0);
    auto uphill = flat;
    uphill.gradient = 0.05;
    auto windy = flat;
    windy.headwind_mps = 8.0;

    EXPECT_GT(motor.consumed_energy(uphill), motor.consumed_energy(flat));
    EXPECT_GT(motor.consumed_energy(windy), motor.consumed_energy(flat));
}

TEST_F(ComponentTest, Motor_AccelerationCostsMore) {
    physics::Motor motor(motor_params, 350.0, atmosphere);
    auto steady = cruising(15.0);
    auto accelerating = steady;
    accelerating.previous_speed_mps = 14.0;
    EXPECT_GT(motor.traction_force(accelerating), motor.traction_force(steady));
}

TEST_F(ComponentTest, Motor_CorneringOnlyForAdvanced) {
    physics::MotorParams basic = motor_params;
    physics::AdvancedMotorParams advanced_params;
    physics::MotorParams advanced = advanced_params;

    auto plain = physics::make_motor(basic, 350.0, atmosphere);
    auto cornering = physics::make_motor(advanced, 350.0, atmosphere);

    auto tick = cruising(15.0);
    tick.curvature = 0.01;
    EXPECT_GT(cornering->consumed_energy(tick), plain->consumed_energy(tick));

    tick.curvature = 0.0;
    EXPECT_NEAR(cornering->consumed_energy(tick), plain->consumed_energy(tick), EPSILON);
}

TEST_F(ComponentTest, Motor_EfficiencyCurvesClipped) {
    EXPECT_GE(physics::Motor::motor_efficiency(0.0, 0.0), 0.7382);
    EXPECT_LE(physics::Motor::motor_efficiency(5000.0, 800.0), 1.0);
    EXPECT_GE(physics::Motor::controller_efficiency(0.0, 0.0), 0.9);
    EXPECT_LE(physics::Motor::controller_efficiency(80.0, 40.0), 1.0);
}

TEST_F(ComponentTest, Motor_FactoryRejectsBadMass) {
    EXPECT_THROW(physics::make_motor(physics::MotorParams(motor_params), 0.0, atmosphere), PreconditionError);
}

TEST_F(ComponentTest, SolarArray_ProducedEnergy) {
    physics::SolarArray array{physics::ArrayParams()};
    auto tick = cruising(0.0);
    tick.irradiance_wm2 = 1000.0;
    EXPECT_NEAR(array.produced_energy(tick), 1000.0 * 0.2432 * 4.0, EPSILON);
}

TEST_F(ComponentTest, LowVoltageSystem_ConstantDraw) {
    physics::LowVoltageSystem lvs{physics::LVSParams()};
    EXPECT_NEAR(lvs.consumed_energy(cruising(0.0)), 18.0, EPSILON);
    EXPECT_NEAR(lvs.consumed_energy(cruising(20.0)), 18.0, EPSILON);
}

TEST_F(ComponentTest, Regen_RecoversBrakingEnergy) {
    physics::RegenBrake regen(physics::RegenParams(), 350.0, 9.81);
    physics::TickConditions tick;
    tick.previous_speed_mps = 10.0;
    tick.speed_mps = 5.0;
    tick.dt_s = 1.0;
    // 0.5 * 350 * (100 - 25) * 0.5
    EXPECT_NEAR(regen.produced_energy(tick), 6562.5, EPSILON);
}

TEST_F(ComponentTest, Regen_NothingWhenAccelerating) {
    physics::RegenBrake regen(physics::RegenParams(), 350.0, 9.81);
    physics::TickConditions tick;
    tick.previous_speed_mps = 5.0;
    tick.speed_mps = 10.0;
    EXPECT_NEAR(regen.produced_energy(tick), 0.0, EPSILON);
}

TEST_F(ComponentTest, Regen_CappedPerTick) {
    physics::RegenParams params;
    params.max_energy_per_tick_j = 1000.0;
    physics::RegenBrake regen(params, 350.0, 9.81);
    physics::TickConditions tick;
    tick.previous_speed_mps = 20.0;
    tick.speed_mps = 10.0;
    EXPECT_NEAR(regen.produced_energy(tick), 1000.0, EPSILON);
}

TEST_F(ComponentTest, Regen_BelowMinimumSpeed) {
    physics::RegenParams params;
    params.min_speed_mps = 12.0;
    physics::RegenBrake regen(params, 350.0, 9.81);
    physics::TickConditions tick;
    tick.previous_speed_mps = 10.0;
    tick.speed_mps = 5.0;
    EXPECT_NEAR(regen.produced_energy(tick), 0.0, EPSILON);
}

} // namespace testing
} // namespace helio

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
