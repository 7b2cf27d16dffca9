#include <lapsim/efficiency_map.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace lapsim {

namespace {

struct Circle {
  double cx = 0.0;
  double cy = 0.0;
  double r2 = std::numeric_limits<double>::infinity(); // degenerate triangles: everything inside
};

static Circle circumcircle(double ax, double ay, double bx, double by, double cx, double cy) {
  Circle c;
  const double d = 2.0 * (ax*(by - cy) + bx*(cy - ay) + cx*(ay - by));
  if (std::abs(d) < 1e-18) return c;
  const double a2 = ax*ax + ay*ay;
  const double b2 = bx*bx + by*by;
  const double c2 = cx*cx + cy*cy;
  c.cx = (a2*(by - cy) + b2*(cy - ay) + c2*(ay - by)) / d;
  c.cy = (a2*(cx - bx) + b2*(ax - cx) + c2*(bx - ax)) / d;
  c.r2 = (ax - c.cx)*(ax - c.cx) + (ay - c.cy)*(ay - c.cy);
  return c;
}

} // namespace

EfficiencyMap::EfficiencyMap(std::vector<EfficiencySample> samples)
  : samples_(std::move(samples)) {
  if (samples_.empty()) return;

  double max_omega = samples_.front().omega_rad_s;
  double max_torque = samples_.front().torque_nm;
  min_omega_ = samples_.front().omega_rad_s;
  min_torque_ = samples_.front().torque_nm;
  for (const auto& s : samples_) {
    min_omega_  = std::min(min_omega_, s.omega_rad_s);
    min_torque_ = std::min(min_torque_, s.torque_nm);
    max_omega   = std::max(max_omega, s.omega_rad_s);
    max_torque  = std::max(max_torque, s.torque_nm);
  }
  span_omega_  = (max_omega  > min_omega_)  ? (max_omega  - min_omega_)  : 1.0;
  span_torque_ = (max_torque > min_torque_) ? (max_torque - min_torque_) : 1.0;

  u_.reserve(samples_.size());
  v_.reserve(samples_.size());
  for (const auto& s : samples_) {
    u_.push_back((s.omega_rad_s - min_omega_) / span_omega_);
    v_.push_back((s.torque_nm - min_torque_) / span_torque_);
  }
  triangulate_();
}

// Bowyer-Watson incremental Delaunay triangulation in normalised coordinates.
void EfficiencyMap::triangulate_() {
  const std::size_t n = u_.size();
  if (n < 3) return;

  // Super triangle vertices live at indices n, n+1, n+2.
  std::vector<double> xs = u_;
  std::vector<double> ys = v_;
  xs.insert(xs.end(), {-100.0, 300.0, -100.0});
  ys.insert(ys.end(), {-100.0, -100.0, 300.0});

  struct Cell { Tri t; Circle c; };
  auto make_cell = [&](std::size_t a, std::size_t b, std::size_t c) {
    return Cell{ Tri{a, b, c}, circumcircle(xs[a], ys[a], xs[b], ys[b], xs[c], ys[c]) };
  };

  std::vector<Cell> cells{ make_cell(n, n + 1, n + 2) };

  for (std::size_t p = 0; p < n; ++p) {
    // Exact duplicates add nothing to the surface.
    bool duplicate = false;
    for (std::size_t q = 0; q < p; ++q) {
      if (xs[q] == xs[p] && ys[q] == ys[p]) { duplicate = true; break; }
    }
    if (duplicate) continue;

    std::vector<Cell> keep;
    std::vector<std::pair<std::size_t, std::size_t>> edges;
    keep.reserve(cells.size());
    for (const auto& cell : cells) {
      const double dx = xs[p] - cell.c.cx;
      const double dy = ys[p] - cell.c.cy;
      if (dx*dx + dy*dy < cell.c.r2) {
        const auto& t = cell.t;
        edges.emplace_back(std::min(t[0], t[1]), std::max(t[0], t[1]));
        edges.emplace_back(std::min(t[1], t[2]), std::max(t[1], t[2]));
        edges.emplace_back(std::min(t[2], t[0]), std::max(t[2], t[0]));
      } else {
        keep.push_back(cell);
      }
    }

    // Cavity boundary: edges owned by exactly one removed triangle.
    for (std::size_t i = 0; i < edges.size(); ++i) {
      std::size_t count = 0;
      for (const auto& e : edges) {
        if (e == edges[i]) ++count;
      }
      if (count == 1) keep.push_back(make_cell(edges[i].first, edges[i].second, p));
    }
    cells = std::move(keep);
  }

  tris_.clear();
  for (const auto& cell : cells) {
    const auto& t = cell.t;
    if (t[0] >= n || t[1] >= n || t[2] >= n) continue;
    const double area = (xs[t[1]] - xs[t[0]]) * (ys[t[2]] - ys[t[0]])
                      - (xs[t[2]] - xs[t[0]]) * (ys[t[1]] - ys[t[0]]);
    if (std::abs(area) < 1e-14) continue;
    tris_.push_back(t);
  }
}

double EfficiencyMap::nearest_(double u, double v) const {
  std::size_t best = 0;
  double best_d2 = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < u_.size(); ++i) {
    const double d2 = (u_[i] - u)*(u_[i] - u) + (v_[i] - v)*(v_[i] - v);
    if (d2 < best_d2) { best_d2 = d2; best = i; }
  }
  return samples_[best].efficiency;
}

EfficiencyLookup EfficiencyMap::lookup(double omega_rad_s, double torque_nm) const {
  if (samples_.empty()) return EfficiencyLookup{0.0, false};

  const double omega  = std::max(omega_rad_s, min_omega_);
  const double torque = std::max(torque_nm, min_torque_);
  const double u = (omega - min_omega_) / span_omega_;
  const double v = (torque - min_torque_) / span_torque_;

  constexpr double kEdgeTolerance = 1e-9;
  for (const auto& t : tris_) {
    const double ax = u_[t[0]], ay = v_[t[0]];
    const double bx = u_[t[1]], by = v_[t[1]];
    const double cx = u_[t[2]], cy = v_[t[2]];
    const double det = (by - cy)*(ax - cx) + (cx - bx)*(ay - cy);
    const double l1 = ((by - cy)*(u - cx) + (cx - bx)*(v - cy)) / det;
    const double l2 = ((cy - ay)*(u - cx) + (ax - cx)*(v - cy)) / det;
    const double l3 = 1.0 - l1 - l2;
    if (l1 >= -kEdgeTolerance && l2 >= -kEdgeTolerance && l3 >= -kEdgeTolerance) {
      return EfficiencyLookup{ l1 * samples_[t[0]].efficiency
                             + l2 * samples_[t[1]].efficiency
                             + l3 * samples_[t[2]].efficiency, true };
    }
  }
  return EfficiencyLookup{ nearest_(u, v), false };
}

} // namespace lapsim
