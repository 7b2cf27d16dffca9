#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include <lapsim/apex.hpp>
#include <lapsim/curvature.hpp>
#include <lapsim/errors.hpp>
#include <lapsim/track_geom.hpp>

using Catch::Approx;
using namespace lapsim;

static constexpr double INF = std::numeric_limits<double>::infinity();

TEST_CASE("Apexes are the local radius minima") {
  const std::vector<double> r{5.0, 3.0, 1.0, 3.0, 5.0, 4.0, 2.0, 4.0};
  REQUIRE(locate_apexes(r) == std::vector<std::size_t>{2, 6});
}

TEST_CASE("Apex detection wraps around the lap") {
  // minimum at index 0, neighbours on both ends of the array
  const std::vector<double> r{1.0, 2.0, 3.0, 4.0, 3.0, 2.0};
  REQUIRE(locate_apexes(r) == std::vector<std::size_t>{0});
}

TEST_CASE("Straights with infinite radius do not create apexes") {
  const std::vector<double> r{INF, INF, 50.0, 20.0, 50.0, INF, INF, INF};
  REQUIRE(locate_apexes(r) == std::vector<std::size_t>{3});
}

TEST_CASE("Uniform radius yields a single apex at the first minimum") {
  REQUIRE(locate_apexes(std::vector<double>(10, 42.0)) == std::vector<std::size_t>{0});
  REQUIRE(locate_apexes({}).empty());
}

TEST_CASE("Brake points are where speed stops increasing") {
  const std::vector<double> v{5.0, 3.0, 1.0, 3.0, 5.0, 4.0, 2.0, 4.0};
  REQUIRE(locate_brake_points(v) == std::vector<std::size_t>{0, 4});

  // constant speed: no transition
  REQUIRE(locate_brake_points(std::vector<double>(8, 20.0)).empty());
}

TEST_CASE("Rotation re-indexes cyclically") {
  CurvatureField f;
  f.radius = {10.0, 11.0, 12.0, 13.0, 14.0};
  f.first.assign(5, Vec2{1.0, 0.0});
  f.second.assign(5, Vec2{0.0, 0.0});
  f.first[2] = Vec2{0.0, 1.0};

  const CurvatureField g = rotate_curvature(f, 2);
  REQUIRE(g.radius == std::vector<double>{12.0, 13.0, 14.0, 10.0, 11.0});
  REQUIRE(g.first[0].y == 1.0);

  DiscretizedTrack t;
  t.ds = 200.0;
  for (int i = 0; i < 5; ++i) t.points.push_back({ double(i), 0.0, 0.0 });
  t.elevation_rad = {0.0, 0.1, 0.2, 0.3, 0.4};
  const DiscretizedTrack u = rotate_track(t, 3);
  REQUIRE(u.points[0].x == 3.0);
  REQUIRE(u.points[4].x == 2.0);
  REQUIRE(u.elevation_rad[1] == 0.4);
  REQUIRE(u.ds == 200.0);
}

TEST_CASE("Alignment puts the first apex at sample 0") {
  DiscretizedTrack t;
  t.ds = 125.0;
  for (int i = 0; i < 8; ++i) t.points.push_back({ double(i), 0.0, 0.0 });
  t.elevation_rad.assign(8, 0.0);

  CurvatureField f;
  f.radius = {5.0, 3.0, 1.0, 3.0, 5.0, 4.0, 2.0, 4.0};
  f.first.assign(8, Vec2{});
  f.second.assign(8, Vec2{});

  const AlignedTrack a = align_to_first_apex(t, f);
  REQUIRE(a.offset == 2);
  REQUIRE(a.apexes == std::vector<std::size_t>{0, 4});
  REQUIRE(a.curvature.radius[0] == 1.0);
  REQUIRE(a.curvature.radius[4] == 2.0);
  REQUIRE(a.track.points[0].x == 2.0);

  CurvatureField short_field = f;
  short_field.radius.pop_back();
  REQUIRE_THROWS_AS(align_to_first_apex(t, short_field), GeometryError);
}

TEST_CASE("Ellipse has exactly two apexes at the tightest points") {
  const DiscretizedTrack t = discretize_track(ellipse_points(300.0, 200.0, 100), 50);
  const CurvatureField f = estimate_curvature(t);
  const auto apexes = locate_apexes(f.radius);

  REQUIRE(apexes == std::vector<std::size_t>{0, 25});

  const double r_min = *std::min_element(f.radius.begin(), f.radius.end());
  for (std::size_t a : apexes) {
    REQUIRE(f.radius[a] == Approx(r_min).epsilon(1e-6));
    // ends of the major axis
    REQUIRE(std::abs(t.points[a].y) < 1e-6 * kTrackLength);
  }
  REQUIRE(t.points[0].x > 0.0);
  REQUIRE(t.points[25].x < 0.0);
}
