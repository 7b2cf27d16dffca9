#include <lapsim/apex.hpp>
#include <lapsim/errors.hpp>
#include <algorithm>
#include <cmath>

namespace lapsim {

static int sign_(double x) {
  return (x > 0.0) - (x < 0.0);
}

// flip[i] = sgn(f[i] - f[i-1]) - sgn(f[i+1] - f[i]) on the circle.
// Equal infinite neighbours count as a zero difference.
static std::vector<int> sign_flips_(const std::vector<double>& f) {
  const std::size_t n = f.size();
  std::vector<int> sign(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double prev = f[(i + n - 1) % n];
    sign[i] = (f[i] == prev) ? 0 : sign_(f[i] - prev);
  }
  std::vector<int> flip(n);
  for (std::size_t i = 0; i < n; ++i) {
    flip[i] = sign[i] - sign[(i + 1) % n];
  }
  return flip;
}

std::vector<std::size_t> locate_apexes(const std::vector<double>& radius) {
  std::vector<std::size_t> apexes;
  if (radius.empty()) return apexes;

  const auto flip = sign_flips_(radius);
  const int lowest = *std::min_element(flip.begin(), flip.end());
  if (lowest < 0) {
    for (std::size_t i = 0; i < flip.size(); ++i) {
      if (flip[i] == lowest) apexes.push_back(i);
    }
    return apexes;
  }

  // Uniform curvature: no decreasing-to-increasing transition anywhere.
  auto it = std::min_element(radius.begin(), radius.end());
  apexes.push_back(static_cast<std::size_t>(std::distance(radius.begin(), it)));
  return apexes;
}

std::vector<std::size_t> locate_brake_points(const std::vector<double>& speed) {
  std::vector<std::size_t> brake;
  if (speed.empty()) return brake;

  const auto flip = sign_flips_(speed);
  const int highest = *std::max_element(flip.begin(), flip.end());
  if (highest <= 0) return brake;
  for (std::size_t i = 0; i < flip.size(); ++i) {
    if (flip[i] == highest) brake.push_back(i);
  }
  return brake;
}

template <class T>
static std::vector<T> rotated_(const std::vector<T>& in, std::size_t offset) {
  const std::size_t n = in.size();
  std::vector<T> out;
  out.reserve(n);
  for (std::size_t k = 0; k < n; ++k) out.push_back(in[(k + offset) % n]);
  return out;
}

DiscretizedTrack rotate_track(const DiscretizedTrack& track, std::size_t offset) {
  DiscretizedTrack out = track;
  out.points = rotated_(track.points, offset);
  out.elevation_rad = rotated_(track.elevation_rad, offset);
  return out;
}

CurvatureField rotate_curvature(const CurvatureField& field, std::size_t offset) {
  CurvatureField out;
  out.first  = rotated_(field.first, offset);
  out.second = rotated_(field.second, offset);
  out.radius = rotated_(field.radius, offset);
  return out;
}

AlignedTrack align_to_first_apex(const DiscretizedTrack& track, const CurvatureField& field) {
  const std::size_t n = field.size();
  if (n == 0 || track.size() != n) {
    throw GeometryError("track and curvature field sizes differ");
  }

  const auto apexes = locate_apexes(field.radius);
  AlignedTrack out;
  out.offset = apexes.front();
  out.track = rotate_track(track, out.offset);
  out.curvature = rotate_curvature(field, out.offset);
  out.apexes.reserve(apexes.size());
  for (std::size_t a : apexes) out.apexes.push_back((a + n - out.offset) % n);
  std::sort(out.apexes.begin(), out.apexes.end());
  return out;
}

} // namespace lapsim
