#pragma once
#include <array>
#include <cstddef>
#include <vector>

namespace lapsim {

// One measured operating point of the engine fuel-efficiency chart.
struct EfficiencySample {
  double omega_rad_s = 0.0;  // crankshaft angular speed
  double torque_nm = 0.0;    // crankshaft torque
  double efficiency = 0.0;   // fraction (0, 1]
};

struct EfficiencyLookup {
  double efficiency = 0.0;
  bool in_range = true;   // false: outside the convex hull, value is the nearest sample's
};

// Scattered-data efficiency surface: Delaunay triangulation of the samples
// with linear (barycentric) interpolation inside the convex hull.
class EfficiencyMap {
public:
  EfficiencyMap() = default;
  explicit EfficiencyMap(std::vector<EfficiencySample> samples);

  // Operating points below the table's lowest speed/torque are clamped up to it.
  EfficiencyLookup lookup(double omega_rad_s, double torque_nm) const;

  const std::vector<EfficiencySample>& samples() const { return samples_; }
  std::size_t triangle_count() const { return tris_.size(); }
  bool empty() const { return samples_.empty(); }
  double min_omega() const { return min_omega_; }
  double min_torque() const { return min_torque_; }

private:
  using Tri = std::array<std::size_t, 3>;

  void triangulate_();
  double nearest_(double u, double v) const;

  std::vector<EfficiencySample> samples_;
  // Samples in normalised [0,1]^2 coordinates for well-conditioned geometry.
  std::vector<double> u_;
  std::vector<double> v_;
  std::vector<Tri> tris_;
  double min_omega_{0.0};
  double min_torque_{0.0};
  double span_omega_{1.0};
  double span_torque_{1.0};
};

} // namespace lapsim
