#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <lapsim/energy.hpp>
#include <lapsim/powertrain.hpp>

using Catch::Approx;
using namespace lapsim;

static Engine make_engine() {
  Engine e;
  e.min_rpm = 2000.0;
  e.max_rpm = 10000.0;
  e.gear_ratios = {10.0, 5.0, 2.5};
  e.power_w = [](double) { return 20000.0; };
  std::vector<EfficiencySample> s;
  for (double w : {100.0, 500.0, 1000.0}) {
    for (double t : {1.0, 50.0, 100.0}) s.push_back({ w, t, 0.25 });
  }
  e.fuel_map = EfficiencyMap(std::move(s));
  return e;
}

TEST_CASE("Segment kinematics helpers") {
  REQUIRE(segment_accel(10.0, 12.0, 20.0) == Approx(1.1));
  REQUIRE(segment_time(10.0, 12.0, 20.0) == Approx(40.0 / 22.0));
  // constant speed
  REQUIRE(segment_accel(15.0, 15.0, 20.0) == 0.0);
  REQUIRE(segment_time(15.0, 15.0, 30.0) == Approx(2.0));
}

TEST_CASE("Electric segment energy is motor energy only") {
  const ElectricPowertrain ev(VehicleParams{300.0, 9.81, 1.0, 0.2286}, Motor{200.0, 80000.0, 6000.0, 4.0, 0.9});
  const EnergyAccountant acc(ev);

  const EnergyUse e = acc.segment(2.0, 10.0, 1.5, 1);
  REQUIRE(e.energy.ice_j == 0.0);
  REQUIRE(e.energy.em_j == Approx(300.0 * 2.0 * 10.0 * 1.5 / 0.9));
  REQUIRE_FALSE(e.warning.has_value());

  const EnergyUse f = acc.fixed_segment(10.0, 12.0, 20.0, 1);
  REQUIRE(f.energy.em_j == Approx(300.0 * 1.1 * 10.0 * (40.0 / 22.0) / 0.9));
}

TEST_CASE("Coasting and braking use no energy") {
  const ElectricPowertrain ev(VehicleParams{300.0, 9.81, 1.0, 0.2286}, Motor{200.0, 80000.0, 6000.0, 4.0, 0.9});
  const EnergyAccountant acc(ev);

  REQUIRE(acc.segment(-3.0, 20.0, 1.0, 1).energy.em_j == 0.0);
  REQUIRE(acc.segment(0.0, 20.0, 1.0, 1).energy.em_j == 0.0);
  REQUIRE(acc.segment(2.0, 20.0, 0.0, 1).energy.em_j == 0.0);
  REQUIRE(acc.fixed_segment(20.0, 15.0, 20.0, 1).energy.em_j == 0.0);
  REQUIRE(acc.fixed_segment(0.0, 0.0, 20.0, 1).energy.em_j == 0.0);
}

TEST_CASE("Hybrid segment splits power between engine and motor") {
  const HybridPowertrain hy(VehicleParams{350.0, 9.81, 1.2, 0.25}, Motor{50.0, 20000.0, 20000.0, 4.0, 0.92},
                            make_engine(), 0.5);
  const EnergyAccountant acc(hy);

  // P = 3500 W; engine at 400 rad/s, 4.375 Nm
  const EnergyUse e = acc.segment(1.0, 10.0, 2.0, 1);
  REQUIRE_FALSE(e.warning.has_value());
  REQUIRE(e.energy.ice_j == Approx(1750.0 * 2.0 / 0.25));
  REQUIRE(e.energy.em_j == Approx(1750.0 * 2.0 / 0.92));
}

TEST_CASE("Fuel lookup below the table is clamped without a warning") {
  const HybridPowertrain hy(VehicleParams{350.0, 9.81, 1.2, 0.25}, Motor{50.0, 20000.0, 20000.0, 4.0, 0.92},
                            make_engine(), 0.5);
  const EnergyAccountant acc(hy);

  // 1 m/s in first: 40 rad/s, below the 100 rad/s table edge
  const EnergyUse e = acc.fuel(175.0, 1.0, 3.0, 1);
  REQUIRE_FALSE(e.warning.has_value());
  REQUIRE(e.energy.ice_j == Approx(175.0 * 3.0 / 0.25));
}

TEST_CASE("Fuel lookup above the table produces a warning and an estimate") {
  const HybridPowertrain hy(VehicleParams{350.0, 9.81, 1.2, 0.25}, Motor{50.0, 20000.0, 20000.0, 4.0, 0.92},
                            make_engine(), 0.5);
  const EnergyAccountant acc(hy);

  // 175 kW at 400 rad/s is 437.5 Nm, above the 100 Nm row
  const EnergyUse e = acc.segment(100.0, 10.0, 0.5, 1);
  REQUIRE(e.warning.has_value());
  REQUIRE(e.warning->omega_rad_s == Approx(400.0));
  REQUIRE(e.warning->torque_nm == Approx(437.5));
  REQUIRE(e.warning->efficiency_estimate == Approx(0.25));
  REQUIRE(e.energy.ice_j == Approx(175000.0 * 0.5 / 0.25));
}

TEST_CASE("Fuel energy is zero without engine power") {
  const HybridPowertrain hy(VehicleParams{350.0, 9.81, 1.2, 0.25}, Motor{50.0, 20000.0, 20000.0, 4.0, 0.92},
                            make_engine(), 0.0);
  const EnergyAccountant acc(hy);

  const EnergyUse e = acc.segment(1.0, 10.0, 2.0, 1);
  REQUIRE(e.energy.ice_j == 0.0);
  REQUIRE(e.energy.em_j == Approx(3500.0 * 2.0 / 0.92));
  REQUIRE(acc.fuel(-10.0, 10.0, 1.0, 1).energy.ice_j == 0.0);
}
