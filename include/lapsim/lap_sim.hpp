#pragma once
#include <cstddef>
#include <vector>
#include <lapsim/apex.hpp>
#include <lapsim/curvature.hpp>
#include <lapsim/powertrain.hpp>
#include <lapsim/solver.hpp>
#include <lapsim/track_geom.hpp>

namespace lapsim {

struct LapSimConfig {
  std::size_t steps = 50;   // number of discretized samples
  SolverConfig solver;
};

struct LapResult {
  DiscretizedTrack track;               // aligned: sample 0 is an apex
  CurvatureField curvature;             // aligned with track
  std::vector<std::size_t> apexes;
  std::vector<std::size_t> brake_points;
  std::size_t offset = 0;               // raw sample index of aligned sample 0
  VelocityProfile profile;

  double lap_time_s = 0.0;              // sum of profile.time_s
  double average_speed_mps = 0.0;       // mean of per-sample speeds
  double total_ice_j = 0.0;
  double total_em_j = 0.0;
};

// Discretize -> curvature -> apex alignment -> velocity profile -> brake points.
LapResult simulate_lap(const RawTrack& raw, const Powertrain& powertrain,
                       const LapSimConfig& config = {});

} // namespace lapsim
