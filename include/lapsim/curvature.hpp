#pragma once
#include <cstddef>
#include <vector>
#include <lapsim/track_geom.hpp>

namespace lapsim {

// Per-sample derivatives and radius of curvature, indexed 1:1 with DiscretizedTrack.
struct CurvatureField {
  std::vector<Vec2> first;      // dp/ds
  std::vector<Vec2> second;     // d2p/ds2
  std::vector<double> radius;   // smoothed; +inf on straights

  std::size_t size() const { return radius.size(); }
};

// Central differences on the circular sample set followed by one pass of
// 3-point circular smoothing of the radius. Smoothing mixes finite and
// infinite neighbours as-is: a sample next to a straight becomes infinite.
CurvatureField estimate_curvature(const DiscretizedTrack& track);

} // namespace lapsim
