#include <lapsim/track_geom.hpp>
#include <lapsim/errors.hpp>
#include <algorithm>
#include <iterator>
#include <string>

namespace lapsim {

static bool same_point_(const Vec3& a, const Vec3& b) {
  return a.x == b.x && a.y == b.y && a.z == b.z;
}

static double distance_(const Vec3& a, const Vec3& b, bool use_z) {
  const double dx = b.x - a.x;
  const double dy = b.y - a.y;
  const double dz = use_z ? (b.z - a.z) : 0.0;
  return std::sqrt(dx*dx + dy*dy + dz*dz);
}

// Drop consecutive duplicates, including a repeated closing point.
static std::vector<Vec3> distinct_points_(const std::vector<Vec3>& in) {
  std::vector<Vec3> out;
  out.reserve(in.size());
  for (const auto& p : in) {
    if (out.empty() || !same_point_(out.back(), p)) out.push_back(p);
  }
  while (out.size() > 1 && same_point_(out.front(), out.back())) out.pop_back();
  return out;
}

// Unique points anywhere on the loop, not only between neighbours.
static std::size_t unique_count_(std::vector<Vec3> pts) {
  auto less = [](const Vec3& a, const Vec3& b) {
    if (a.x != b.x) return a.x < b.x;
    if (a.y != b.y) return a.y < b.y;
    return a.z < b.z;
  };
  std::sort(pts.begin(), pts.end(), less);
  return static_cast<std::size_t>(std::distance(pts.begin(), std::unique(pts.begin(), pts.end(), same_point_)));
}

TrackSpline::TrackSpline(const RawTrack& raw)
  : has_elevation_(raw.has_elevation) {
  std::vector<Vec3> pts = distinct_points_(raw.points);
  const std::size_t distinct = unique_count_(pts);
  if (distinct < 3) {
    throw GeometryError("track needs at least 3 distinct points, got " + std::to_string(distinct));
  }

  const std::size_t n = pts.size();
  std::vector<double> seg(n);
  double total = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    seg[i] = distance_(pts[i], pts[(i + 1) % n], has_elevation_);
    total += seg[i];
  }
  if (!(total > 1e-9)) {
    throw GeometryError("track has zero length");
  }
  raw_length_ = total;
  scale_ = kTrackLength / total;

  // s = 0 for the first point, s = 1 for the first point appended at the end.
  std::vector<double> knots(n + 1, 0.0);
  for (std::size_t i = 0; i < n; ++i) knots[i+1] = knots[i] + seg[i] / total;
  knots[n] = 1.0;

  std::vector<double> xs(n + 1), ys(n + 1), zs(n + 1);
  for (std::size_t i = 0; i <= n; ++i) {
    const Vec3& p = pts[i % n];
    xs[i] = p.x * scale_;
    ys[i] = p.y * scale_;
    zs[i] = p.z * scale_;
  }
  fx_ = PeriodicCubicSpline(knots, std::move(xs));
  fy_ = PeriodicCubicSpline(knots, std::move(ys));
  if (has_elevation_) fz_ = PeriodicCubicSpline(std::move(knots), std::move(zs));
}

Vec3 TrackSpline::point_at(double u) const {
  return Vec3{ fx_(u), fy_(u), has_elevation_ ? fz_(u) : 0.0 };
}

DiscretizedTrack discretize_track(const RawTrack& raw, std::size_t steps) {
  if (steps < 3) {
    throw GeometryError("sample count must be at least 3, got " + std::to_string(steps));
  }
  const TrackSpline spline(raw);

  DiscretizedTrack out;
  out.has_elevation = raw.has_elevation;
  out.ds = kTrackLength / double(steps);
  out.points.reserve(steps);
  for (std::size_t j = 0; j < steps; ++j) {
    out.points.push_back(spline.point_at(double(j) / double(steps)));
  }

  out.elevation_rad.assign(steps, 0.0);
  if (out.has_elevation) {
    for (std::size_t j = 0; j < steps; ++j) {
      const Vec3& prev = out.points[(j + steps - 1) % steps];
      const Vec3& next = out.points[(j + 1) % steps];
      const double dx = 0.5 * (next.x - prev.x);
      const double dy = 0.5 * (next.y - prev.y);
      const double dz = 0.5 * (next.z - prev.z);
      out.elevation_rad[j] = std::atan2(dz, std::sqrt(dx*dx + dy*dy));
    }
  }
  return out;
}

RawTrack catmull_rom_points(const std::vector<Vec2>& ctrl, int samples_per_segment) {
  const std::size_t n = ctrl.size();
  if (n < 3 || samples_per_segment <= 0) return RawTrack{};

  std::vector<Vec2> pts;
  pts.reserve(n * static_cast<std::size_t>(samples_per_segment));
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& before = ctrl[(i + n - 1) % n];
    const Vec2& p0 = ctrl[i];
    const Vec2& p1 = ctrl[(i + 1) % n];
    const Vec2& after = ctrl[(i + 2) % n];
    // Hermite form with tangents from the neighbouring control points.
    const Vec2 m0{ 0.5 * (p1.x - before.x), 0.5 * (p1.y - before.y) };
    const Vec2 m1{ 0.5 * (after.x - p0.x), 0.5 * (after.y - p0.y) };
    for (int k = 0; k < samples_per_segment; ++k) {
      const double t = double(k) / double(samples_per_segment);
      const double t2 = t * t;
      const double t3 = t2 * t;
      const double h00 = 2.0*t3 - 3.0*t2 + 1.0;
      const double h10 = t3 - 2.0*t2 + t;
      const double h01 = 3.0*t2 - 2.0*t3;
      const double h11 = t3 - t2;
      pts.push_back({ h00*p0.x + h10*m0.x + h01*p1.x + h11*m1.x,
                      h00*p0.y + h10*m0.y + h01*p1.y + h11*m1.y });
    }
  }
  return RawTrack::from_xy(pts);
}

std::optional<RawTrack> track_preset(const std::string& name) {
  if (name == "ellipse") return ellipse_points(200.0, 100.0, 100);
  if (name == "stadium") return stadium_points(300.0, 60.0);
  if (name == "kidney") {
    return catmull_rom_points({ {0.0, 0.0}, {300.0, -40.0}, {420.0, 60.0}, {360.0, 200.0},
                                {200.0, 150.0}, {80.0, 220.0}, {-60.0, 140.0} });
  }
  return std::nullopt;
}

} // namespace lapsim
