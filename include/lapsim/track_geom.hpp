#pragma once
#include <vector>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <optional>
#include <string>
#include <lapsim/spline.hpp>

namespace lapsim {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

// Every track is rescaled to this total arc length before sampling.
inline constexpr double kTrackLength = 1000.0;

struct Vec2 {
  double x{};
  double y{};
};

struct Vec3 {
  double x{};
  double y{};
  double z{};
};

// Ordered raw track points. The loop is implicitly closed (last -> first).
struct RawTrack {
  std::vector<Vec3> points;
  bool has_elevation = false;   // use z for elevation angles

  static RawTrack from_xy(const std::vector<Vec2>& pts) {
    RawTrack t;
    t.points.reserve(pts.size());
    for (const auto& p : pts) t.points.push_back({p.x, p.y, 0.0});
    return t;
  }
};

// N samples at uniform normalised arc length. Sample N wraps to sample 0.
struct DiscretizedTrack {
  std::vector<Vec3> points;
  std::vector<double> elevation_rad;
  double ds = 0.0;                  // arc length between samples
  double length = kTrackLength;
  bool has_elevation = false;

  std::size_t size() const { return points.size(); }
};

// Periodic cubic interpolant of a raw track over normalised arc length u in [0,1].
class TrackSpline {
public:
  explicit TrackSpline(const RawTrack& raw);

  // Position in normalised (1000-unit) coordinates; u wraps, u == 1 closes the loop.
  Vec3 point_at(double u) const;

  double raw_length() const { return raw_length_; }
  double scale() const { return scale_; }
  bool has_elevation() const { return has_elevation_; }

private:
  PeriodicCubicSpline fx_;
  PeriodicCubicSpline fy_;
  PeriodicCubicSpline fz_;
  double raw_length_{0.0};
  double scale_{1.0};
  bool has_elevation_{false};
};

// Resample raw points into `steps` arc-length-uniform samples.
// Throws GeometryError on fewer than 3 distinct points, zero length or steps < 3.
DiscretizedTrack discretize_track(const RawTrack& raw, std::size_t steps);

// Factory: ellipse with semi-axes a (x) and b (y), `resolution` points at uniform angle.
inline RawTrack ellipse_points(double a, double b, int resolution = 10) {
  std::vector<Vec2> pts;
  pts.reserve(static_cast<std::size_t>(resolution > 0 ? resolution : 0));
  for (int i = 0; i < resolution; ++i) {
    const double s = kTAU * double(i) / double(resolution);
    pts.push_back({ a * std::cos(s), b * std::sin(s) });
  }
  return RawTrack::from_xy(pts);
}

// Factory: rounded-rectangle "stadium" track centered at (0,0)
// straight_len: length of each straight section (centerline)
// radius: corner radius (centerline)
inline RawTrack stadium_points(double straight_len, double radius, int arc_pts_per_quadrant = 12) {
  std::vector<Vec2> pts;
  const double R = radius;
  const double L = straight_len * 0.5;

  // Arc end points are skipped so the straights join without duplicates.
  auto arc = [&](double cx, double cy, double a0, double a1, int steps){
    for (int i = 0; i < steps; ++i) {
      double a = a0 + (a1 - a0) * (double(i)/double(steps));
      pts.push_back({ cx + R*std::cos(a), cy + R*std::sin(a) });
    }
  };
  auto straight = [&](double x0, double x1, double y, int steps){
    for (int i = 0; i < steps; ++i) {
      pts.push_back({ x0 + (x1 - x0) * (double(i)/double(steps)), y });
    }
  };

  arc( L, 0.0, -kPI/2.0, +kPI/2.0, arc_pts_per_quadrant*2 );
  straight( +L, -L, +R, arc_pts_per_quadrant );
  arc( -L, 0.0, +kPI/2.0, 3.0*kPI/2.0, arc_pts_per_quadrant*2 );
  straight( -L, +L, -R, arc_pts_per_quadrant );
  return RawTrack::from_xy(pts);
}

// Closed Catmull-Rom loop through the control polygon, `samples_per_segment`
// points per edge starting at each control point. Empty below 3 control points.
RawTrack catmull_rom_points(const std::vector<Vec2>& ctrl, int samples_per_segment = 24);

// Built-in tracks by name: "ellipse", "stadium", "kidney".
std::optional<RawTrack> track_preset(const std::string& name);

} // namespace lapsim
