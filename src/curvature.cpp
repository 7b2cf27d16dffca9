#include <lapsim/curvature.hpp>
#include <lapsim/errors.hpp>
#include <cmath>
#include <limits>

namespace lapsim {

// |v x a| below this fraction of |v|^3 is treated as a straight section.
static constexpr double kStraightTolerance = 1e-12;

template <class P>
static std::vector<Vec2> central_difference_(const std::vector<P>& f, double ds) {
  const std::size_t n = f.size();
  std::vector<Vec2> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    const P& prev = f[(i + n - 1) % n];
    const P& cur  = f[i];
    const P& next = f[(i + 1) % n];
    // average of the backward and forward differences
    out[i].x = ((cur.x - prev.x) + (next.x - cur.x)) * 0.5 / ds;
    out[i].y = ((cur.y - prev.y) + (next.y - cur.y)) * 0.5 / ds;
  }
  return out;
}

CurvatureField estimate_curvature(const DiscretizedTrack& track) {
  const std::size_t n = track.size();
  if (n < 3 || !(track.ds > 0.0)) {
    throw GeometryError("curvature needs at least 3 samples and a positive ds");
  }

  CurvatureField out;
  out.first  = central_difference_(track.points, track.ds);
  out.second = central_difference_(out.first, track.ds);

  std::vector<double> raw(n);
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& v = out.first[i];
    const Vec2& a = out.second[i];
    const double speed = std::sqrt(v.x*v.x + v.y*v.y);
    const double num = speed * speed * speed;
    const double den = std::abs(v.x*a.y - v.y*a.x);
    raw[i] = (den <= num * kStraightTolerance) ? std::numeric_limits<double>::infinity()
                                               : num / den;
  }

  out.radius.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.radius[i] = (raw[(i + n - 1) % n] + raw[i] + raw[(i + 1) % n]) / 3.0;
  }
  return out;
}

} // namespace lapsim
