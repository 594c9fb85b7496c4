/**
 * @file test_simulation.cpp
 * @brief GoogleTest suite for the tick loop and the simulation model.
 *
 * Uses a synthetic straight route and an hourly forecast built in code so
 * that the expected values do not depend on the sample files.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "physics/SolarGeometry.h"
#include "physics/Types.h"
#include "simulation/Race.h"
#include "simulation/Route.h"
#include "simulation/Simulation.h"
#include "simulation/SimulationModel.h"
#include "simulation/Weather.h"
#include "utils/ConfigManager.h"
#include "utils/Errors.h"

namespace helio {
namespace testing {

constexpr double EPSILON = 1e-6;
constexpr double TIME_ZONE_S = -18000.0;

// ============================================================================
// Fixture
// ============================================================================
class SimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::instance().initialize(TEST_CONFIG_DIR);
    }

    /// One race day, driving 10:00-12:00 local, charging 08:00-18:00
    static sim::RaceConfig one_day_race(int tiling = 1) {
        RaceProps props;
        props.name = "FSGP";
        props.tiling = tiling;
        props.start_year = 2024;
        props.start_month = 7;
        props.start_day = 16;
        DayWindows day;
        day.charging_begin = 28800;
        day.charging_end = 64800;
        day.driving_begin = 36000;
        day.driving_end = 43200;
        props.days = {day};
        return sim::RaceConfig(sim::RaceType::FSGP, props);
    }

    static std::shared_ptr<const sim::Route> straight_route(double length_km, int tiling = 1) {
        std::vector<sim::RouteNode> nodes;
        for (int k = 0; k <= static_cast<int>(length_km); ++k) {
            sim::RouteNode node;
            node.latitude_deg = 40.0;
            node.longitude_deg = -95.0 + k / 85.0;
            node.distance_m = 1000.0 * k;
            node.elevation_m = 300.0;
            node.speed_limit_kmh = 100.0;
            node.time_zone_s = TIME_ZONE_S;
            nodes.push_back(node);
        }
        return std::make_shared<const sim::Route>(std::move(nodes), tiling);
    }

    static std::int64_t race_start_unix(const sim::RaceConfig& race) {
        return physics::days_from_civil(race.start_year(), race.start_month(), race.start_day()) * 86400 -
               static_cast<std::int64_t>(TIME_ZONE_S);
    }

    static std::shared_ptr<const sim::WeatherSeries> hourly_weather(const sim::RaceConfig& race,
                                                                    std::optional<double> ghi = std::nullopt) {
        const std::int64_t start = race_start_unix(race);
        std::vector<sim::WeatherRecord> records;
        for (std::int64_t t = start - 3600; t <= start + race.duration_s() + 3600; t += 3600) {
            sim::WeatherRecord record;
            record.timestamp = t;
            record.ghi_wm2 = ghi;
            record.wind_speed_mps = 2.0;
            record.wind_direction_deg = 270.0;
            record.cloud_cover_percent = 10.0;
            records.push_back(record);
        }
        return std::make_shared<const sim::WeatherSeries>(std::move(records));
    }

    static physics::CarConfig tiny_battery_car() {
        physics::CarConfig car;
        car.name = "tiny";
        physics::BasicBatteryParams battery;
        battery.max_energy_capacity_wh = 5.0;
        car.battery = battery;
        return car;
    }

    static sim::SimulationModel make_model(double route_km = 200.0,
                                           sim::SimulationSettings settings = {},
                                           physics::CarConfig car = {},
                                           std::optional<double> ghi = std::nullopt) {
        sim::RaceConfig race = one_day_race();
        auto weather = hourly_weather(race, ghi);
        return sim::SimulationModel(car, straight_route(route_km), weather, race, settings);
    }

    static double scalar(const sim::ResultValue& value) {
        return std::get<double>(value);
    }

    static const std::vector<double>& array(const sim::ResultValue& value) {
        return std::get<std::vector<double>>(value);
    }
};

// ============================================================================
// Test 1: Model construction
// ============================================================================
TEST_F(SimulationTest, Model_Dimensions) {
    auto model = make_model();

    EXPECT_EQ(model.driving_time_divisions(), 2u);
    EXPECT_EQ(model.tick_count(), 86400u);
    EXPECT_EQ(model.simulation_duration_s(), 86400);
    EXPECT_EQ(model.simulation_start_unix(), race_start_unix(one_day_race()));
}

TEST_F(SimulationTest, Model_StartOffsetShortensHorizon) {
    sim::SimulationSettings settings;
    settings.start_offset_s = 39600;   // 11:00 local, one driving hour left
    auto model = make_model(200.0, settings);

    EXPECT_EQ(model.driving_time_divisions(), 1u);
    EXPECT_EQ(model.simulation_duration_s(), 86400 - 39600);
    EXPECT_EQ(model.tick_count(), static_cast<std::size_t>(86400 - 39600));
}

TEST_F(SimulationTest, Model_RejectsStartOutsideRace) {
    sim::SimulationSettings settings;
    settings.start_offset_s = 86400;
    EXPECT_THROW(make_model(200.0, settings), PreconditionError);

    settings.start_offset_s = -1;
    EXPECT_THROW(make_model(200.0, settings), PreconditionError);
}

TEST_F(SimulationTest, Model_RejectsInvalidCar) {
    physics::CarConfig car;
    car.vehicle.mass_kg = -1.0;
    EXPECT_THROW(make_model(200.0, {}, car), PreconditionError);
}

TEST_F(SimulationTest, Model_RouteTilingMustMatchRace) {
    const sim::SimulationSettings settings;
    sim::RaceConfig three_laps = one_day_race(3);
    auto weather = hourly_weather(three_laps);

    EXPECT_THROW(sim::SimulationModel({}, straight_route(10.0), weather, three_laps, settings),
                 PreconditionError);
    EXPECT_THROW(sim::SimulationModel({}, straight_route(10.0, 2), weather, three_laps, settings),
                 PreconditionError);
    EXPECT_THROW(sim::SimulationModel({}, straight_route(10.0, 3), weather, one_day_race(), settings),
                 PreconditionError);

    sim::SimulationModel model({}, straight_route(10.0, 3), weather, three_laps, settings);
    EXPECT_EQ(model.route().tiling(), 3);
    EXPECT_GT(model.route().length_m(), 30000.0);
}

TEST_F(SimulationTest, Model_WeatherMustCoverHorizon) {
    sim::RaceConfig race = one_day_race();
    const std::int64_t start = race_start_unix(race);

    std::vector<sim::WeatherRecord> records;
    for (std::int64_t t = start; t <= start + 43200; t += 3600) {
        sim::WeatherRecord record;
        record.timestamp = t;
        records.push_back(record);
    }
    auto weather = std::make_shared<const sim::WeatherSeries>(std::move(records));

    EXPECT_THROW(sim::SimulationModel(physics::CarConfig{}, straight_route(10.0), weather, race,
                                      sim::SimulationSettings{}),
                 DataCoverageError);
}

TEST_F(SimulationTest, Settings_FromConfig) {
    auto settings = sim::SimulationSettings::from_config();
    EXPECT_EQ(settings.tick_s, 1);
    EXPECT_EQ(settings.granularity, 1);
    EXPECT_EQ(settings.start_offset_s, 0);
    EXPECT_NEAR(settings.initial_soc, 1.0, EPSILON);
    EXPECT_FALSE(settings.acceleration_cap_enabled);
    EXPECT_EQ(settings.exhaustion_policy, sim::ExhaustionPolicy::Continue);
    EXPECT_NEAR(settings.gravity, 9.81, EPSILON);
}

TEST_F(SimulationTest, Settings_ParseExhaustionPolicy) {
    EXPECT_EQ(sim::parse_exhaustion_policy("stop"), sim::ExhaustionPolicy::Stop);
    EXPECT_EQ(sim::parse_exhaustion_policy("continue"), sim::ExhaustionPolicy::Continue);
    EXPECT_THROW(sim::parse_exhaustion_policy("halt"), PreconditionError);
}

// ============================================================================
// Test 2: Tick loop
// ============================================================================
TEST_F(SimulationTest, Simulate_DistanceIsMonotonic) {
    auto model = make_model();
    sim::Simulation run = model.simulate({40.0, 50.0});

    const auto& distances = run.trajectory().distances;
    ASSERT_EQ(distances.size(), model.tick_count());
    for (std::size_t t = 1; t < distances.size(); ++t) {
        EXPECT_GE(distances[t], distances[t - 1]);
    }
    EXPECT_NEAR(run.summary().distance_travelled_m, distances.back(), EPSILON);

    // Two hours at 40 then 50 km/h, less the braking at the end of the window
    EXPECT_GT(run.summary().distance_travelled_m, 89000.0);
    EXPECT_LT(run.summary().distance_travelled_m, 90000.0 + EPSILON);
}

TEST_F(SimulationTest, Simulate_ZeroSpeedsUseNoTraction) {
    auto model = make_model();
    sim::Simulation run = model.simulate({0.0, 0.0});

    EXPECT_NEAR(run.summary().distance_travelled_m, 0.0, EPSILON);
    for (double e : run.trajectory().motor_energy) {
        EXPECT_NEAR(e, 0.0, EPSILON);
    }
    for (double e : run.trajectory().regen_energy) {
        EXPECT_NEAR(e, 0.0, EPSILON);
    }
    // The low voltage system still draws power while the car may drive
    EXPECT_NEAR(run.trajectory().lvs_energy[36000], 18.0, EPSILON);
    EXPECT_NEAR(run.trajectory().lvs_energy[35999], 0.0, EPSILON);
}

TEST_F(SimulationTest, Simulate_NonDrivingTicksStayParked) {
    auto model = make_model();
    sim::Simulation run = model.simulate({60.0, 60.0});

    const auto& speed = run.trajectory().speed_kmh;
    EXPECT_NEAR(speed[35999], 0.0, EPSILON);
    EXPECT_NEAR(speed[36000], 60.0, EPSILON);
    EXPECT_NEAR(speed[43200], 0.0, EPSILON);
    EXPECT_NEAR(run.trajectory().distances[35999], 0.0, EPSILON);
}

TEST_F(SimulationTest, Simulate_SolarChargingOnlyInWindow) {
    auto model = make_model();
    sim::Simulation run = model.simulate({0.0, 0.0});

    const auto& array_energy = run.trajectory().array_energy;
    EXPECT_NEAR(array_energy[28799], 0.0, EPSILON);
    EXPECT_GT(array_energy[43200], 0.0);          // 12:00 local
    EXPECT_NEAR(array_energy[64800], 0.0, EPSILON);
}

TEST_F(SimulationTest, Simulate_ForecastIrradianceIsUsed) {
    auto model = make_model(200.0, {}, {}, 500.0);
    sim::Simulation run = model.simulate({0.0, 0.0});

    EXPECT_NEAR(run.trajectory().solar_irradiance[50000], 500.0, EPSILON);
    EXPECT_NEAR(run.trajectory().array_energy[50000], 500.0 * 0.2432 * 4.0, EPSILON);
}

TEST_F(SimulationTest, Simulate_RouteCompletion) {
    auto model = make_model(20.0);
    sim::Simulation run = model.simulate({60.0, 60.0});
    const auto& summary = run.summary();

    EXPECT_NEAR(summary.route_length_m, 20000.0, EPSILON);
    EXPECT_NEAR(summary.distance_travelled_m, 20000.0, EPSILON);
    // 20 km at 60 km/h from 10:00 local
    EXPECT_NEAR(summary.time_taken_s, 36000.0 + 1200.0, 2.0);

    // Parked once the route is done
    EXPECT_NEAR(run.trajectory().speed_kmh[36000 + 1300], 0.0, EPSILON);
    EXPECT_NEAR(run.trajectory().raw_speed_kmh[36000 + 1300], 60.0, EPSILON);
}

TEST_F(SimulationTest, Simulate_UnfinishedRouteTakesWholeHorizon) {
    auto model = make_model();
    sim::Simulation run = model.simulate({30.0, 30.0});
    EXPECT_NEAR(run.summary().time_taken_s, 86400.0, EPSILON);
}

TEST_F(SimulationTest, Simulate_SpeedLimitsApply) {
    auto model = make_model();
    sim::Simulation run = model.simulate({150.0, 150.0});
    for (double v : run.trajectory().speed_kmh) {
        EXPECT_LE(v, 100.0 + EPSILON);
    }
}

TEST_F(SimulationTest, Simulate_LengthMismatch) {
    auto model = make_model();
    EXPECT_THROW(model.simulate({40.0}), PreconditionError);
    EXPECT_THROW(model.simulate({40.0, 40.0, 40.0}), PreconditionError);
}

TEST_F(SimulationTest, Simulate_RejectsNegativeSpeeds) {
    auto model = make_model();
    EXPECT_THROW(model.simulate({-30.0, -30.0}), PreconditionError);
    EXPECT_THROW(model.simulate({40.0, std::nan("")}), PreconditionError);
    EXPECT_THROW(model.run_model({-30.0, -30.0}), PreconditionError);
    EXPECT_FALSE(model.has_results());

    std::vector<double> tick_speeds(model.tick_count(), 40.0);
    tick_speeds[100] = -1.0;
    EXPECT_THROW(sim::Simulation(model, tick_speeds), PreconditionError);
}

TEST_F(SimulationTest, Simulate_FullBatteryStaysSuccessful) {
    auto model = make_model();
    sim::Simulation run = model.simulate({30.0, 30.0});

    EXPECT_TRUE(run.summary().was_successful);
    EXPECT_GT(run.summary().final_soc, 0.0);
    EXPECT_LE(run.summary().final_soc, 1.0);
    EXPECT_NEAR(run.summary().distance_before_exhaustion_m, run.summary().distance_travelled_m, EPSILON);
}

// ============================================================================
// Test 3: Battery exhaustion
// ============================================================================
TEST_F(SimulationTest, Exhaustion_ContinuePolicyKeepsDriving) {
    auto model = make_model(200.0, {}, tiny_battery_car(), 0.0);
    sim::Simulation run = model.simulate({80.0, 80.0});
    const auto& summary = run.summary();

    EXPECT_FALSE(summary.was_successful);
    EXPECT_LT(summary.min_raw_soc, 0.0);
    EXPECT_NEAR(summary.final_soc, 0.0, EPSILON);
    EXPECT_GT(summary.distance_travelled_m, summary.distance_before_exhaustion_m);

    // Clamped SOC never leaves [0, 1]
    for (double soc : run.trajectory().state_of_charge) {
        EXPECT_GE(soc, 0.0);
        EXPECT_LE(soc, 1.0);
    }
    EXPECT_LT(run.trajectory().raw_soc.back(), 0.0);
}

TEST_F(SimulationTest, Exhaustion_StopPolicyParksTheCar) {
    sim::SimulationSettings settings;
    settings.exhaustion_policy = sim::ExhaustionPolicy::Stop;
    auto model = make_model(200.0, settings, tiny_battery_car(), 0.0);
    sim::Simulation run = model.simulate({80.0, 80.0});
    const auto& summary = run.summary();

    EXPECT_FALSE(summary.was_successful);
    EXPECT_GT(summary.distance_before_exhaustion_m, 0.0);
    EXPECT_NEAR(summary.distance_travelled_m, summary.distance_before_exhaustion_m, 30.0);
    EXPECT_NEAR(run.trajectory().speed_kmh[43000], 0.0, EPSILON);
}

// ============================================================================
// Test 4: Results
// ============================================================================
TEST_F(SimulationTest, Results_PrematureRequest) {
    auto model = make_model();
    EXPECT_FALSE(model.has_results());
    EXPECT_THROW(model.get_results({"distance_travelled"}), PrematureDataRecoveryError);
    EXPECT_THROW(model.last_simulation(), PrematureDataRecoveryError);
}

TEST_F(SimulationTest, Results_InRequestedOrder) {
    auto model = make_model();
    model.run_model({40.0, 40.0});
    ASSERT_TRUE(model.has_results());

    auto results = model.get_results({"speed_kmh", "distance_travelled", "was_successful"});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(array(results[0]).size(), model.tick_count());
    EXPECT_NEAR(scalar(results[1]), model.last_simulation().summary().distance_travelled_m, EPSILON);
    EXPECT_NEAR(scalar(results[2]), 1.0, EPSILON);
}

TEST_F(SimulationTest, Results_UnknownKey) {
    auto model = make_model();
    model.run_model({40.0, 40.0});
    EXPECT_THROW(model.get_results({"distance_travelled", "warp_factor"}), std::invalid_argument);
}

TEST_F(SimulationTest, Results_ArrayNeedsTrajectory) {
    auto model = make_model();
    sim::Simulation run = model.simulate({40.0, 40.0}, false);

    EXPECT_FALSE(run.has_trajectory());
    EXPECT_NO_THROW(run.get_result("time_taken"));
    EXPECT_THROW(run.get_result("state_of_charge"), std::invalid_argument);
}

TEST_F(SimulationTest, Results_SummaryMatchesRecordedRun) {
    auto model = make_model();
    auto recorded = model.simulate({45.0, 35.0}, true);
    auto bare = model.simulate({45.0, 35.0}, false);

    EXPECT_DOUBLE_EQ(recorded.summary().distance_travelled_m, bare.summary().distance_travelled_m);
    EXPECT_DOUBLE_EQ(recorded.summary().final_soc, bare.summary().final_soc);
    EXPECT_DOUBLE_EQ(recorded.summary().time_taken_s, bare.summary().time_taken_s);
}

TEST_F(SimulationTest, Results_WindSpeedAndHeadwind) {
    auto model = make_model();
    model.run_model({40.0, 40.0});
    auto results = model.get_results({"wind_speed", "headwind"});
    const auto& wind = array(results[0]);
    const auto& headwind = array(results[1]);

    ASSERT_EQ(wind.size(), model.tick_count());
    ASSERT_EQ(headwind.size(), model.tick_count());
    // 2 m/s westerly forecast while driving east is a tailwind
    for (std::size_t t : {0u, 36000u, 40000u, 86399u}) {
        EXPECT_NEAR(wind[t], 2.0, EPSILON);
        EXPECT_NEAR(headwind[t], -2.0, 0.01);
    }
}

TEST_F(SimulationTest, Results_KeyList) {
    const auto& keys = sim::Simulation::result_keys();
    EXPECT_EQ(keys.size(), 32u);
    EXPECT_NE(std::find(keys.begin(), keys.end(), "time_taken"), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), "state_of_charge"), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), "solar_irradiance"), keys.end());
}

} // namespace testing
} // namespace helio

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
