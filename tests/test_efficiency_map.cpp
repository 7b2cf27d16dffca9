#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <utility>
#include <vector>

#include <lapsim/efficiency_map.hpp>

using Catch::Approx;
using namespace lapsim;

// Plane through the table so any valid triangulation interpolates it exactly.
static double plane(double omega, double torque) {
  return 0.2 + 0.0001 * omega + 0.001 * torque;
}

static EfficiencyMap make_grid_map() {
  std::vector<EfficiencySample> s;
  for (double w : {100.0, 200.0, 300.0, 400.0}) {
    for (double t : {10.0, 20.0, 30.0, 40.0}) {
      s.push_back({ w, t, plane(w, t) });
    }
  }
  return EfficiencyMap(std::move(s));
}

TEST_CASE("EfficiencyMap triangulates a grid") {
  const EfficiencyMap m = make_grid_map();
  REQUIRE(m.samples().size() == 16);
  // 2n - h - 2 triangles for n points, h on the hull
  REQUIRE(m.triangle_count() == 18);
  REQUIRE(m.min_omega() == 100.0);
  REQUIRE(m.min_torque() == 10.0);
}

TEST_CASE("EfficiencyMap interpolates linearly inside the hull") {
  const EfficiencyMap m = make_grid_map();

  for (auto [w, t] : { std::pair{250.0, 25.0}, std::pair{130.0, 37.0}, std::pair{399.0, 11.0} }) {
    const EfficiencyLookup e = m.lookup(w, t);
    REQUIRE(e.in_range);
    REQUIRE(e.efficiency == Approx(plane(w, t)).margin(1e-9));
  }

  // table samples and hull edges are inside
  REQUIRE(m.lookup(300.0, 20.0).efficiency == Approx(plane(300.0, 20.0)).margin(1e-9));
  REQUIRE(m.lookup(400.0, 25.0).in_range);
}

TEST_CASE("EfficiencyMap clamps below the table minimum") {
  const EfficiencyMap m = make_grid_map();

  const EfficiencyLookup low = m.lookup(20.0, 1.0);
  REQUIRE(low.in_range);
  REQUIRE(low.efficiency == Approx(plane(100.0, 10.0)).margin(1e-9));

  const EfficiencyLookup low_speed = m.lookup(0.0, 25.0);
  REQUIRE(low_speed.in_range);
  REQUIRE(low_speed.efficiency == Approx(plane(100.0, 25.0)).margin(1e-9));
}

TEST_CASE("EfficiencyMap flags points above the hull") {
  const EfficiencyMap m = make_grid_map();

  const EfficiencyLookup high = m.lookup(1000.0, 100.0);
  REQUIRE_FALSE(high.in_range);
  // nearest sample estimate
  REQUIRE(high.efficiency == Approx(plane(400.0, 40.0)));

  const EfficiencyLookup high_torque = m.lookup(210.0, 500.0);
  REQUIRE_FALSE(high_torque.in_range);
  REQUIRE(high_torque.efficiency == Approx(plane(200.0, 40.0)));
}

TEST_CASE("EfficiencyMap handles scattered samples") {
  std::vector<EfficiencySample> s{
    {100.0, 10.0, 0.0}, {420.0, 12.0, 0.0}, {260.0, 55.0, 0.0},
    {150.0, 80.0, 0.0}, {390.0, 85.0, 0.0}, {240.0, 30.0, 0.0},
  };
  for (auto& p : s) p.efficiency = plane(p.omega_rad_s, p.torque_nm);
  const EfficiencyMap m(s);

  REQUIRE(m.triangle_count() > 0);
  const EfficiencyLookup e = m.lookup(260.0, 50.0);
  REQUIRE(e.in_range);
  REQUIRE(e.efficiency == Approx(plane(260.0, 50.0)).margin(1e-9));
}

TEST_CASE("EfficiencyMap with too few samples falls back to the nearest one") {
  const EfficiencyMap two({ {100.0, 10.0, 0.3}, {200.0, 20.0, 0.35} });
  REQUIRE(two.triangle_count() == 0);
  const EfficiencyLookup e = two.lookup(190.0, 19.0);
  REQUIRE_FALSE(e.in_range);
  REQUIRE(e.efficiency == Approx(0.35));

  const EfficiencyMap empty;
  REQUIRE(empty.empty());
  REQUIRE_FALSE(empty.lookup(1.0, 1.0).in_range);
}
