#pragma once
#include <cstddef>
#include <vector>
#include <lapsim/curvature.hpp>
#include <lapsim/track_geom.hpp>

namespace lapsim {

// Indices of local radius minima (corner apexes), ascending.
// A radius field without any local minimum (e.g. a true circle) yields a
// single apex at the smallest radius, first index on ties.
std::vector<std::size_t> locate_apexes(const std::vector<double>& radius);

// Indices where the speed goes from increasing to decreasing. Empty when
// the profile has no such transition (constant speed).
std::vector<std::size_t> locate_brake_points(const std::vector<double>& speed);

// Cyclic re-indexing: element k of the result is element (k + offset) % n.
DiscretizedTrack rotate_track(const DiscretizedTrack& track, std::size_t offset);
CurvatureField rotate_curvature(const CurvatureField& field, std::size_t offset);

// Track and curvature re-indexed so that sample 0 is the first apex.
struct AlignedTrack {
  DiscretizedTrack track;
  CurvatureField curvature;
  std::vector<std::size_t> apexes;   // in the rotated frame, apexes[0] == 0
  std::size_t offset = 0;            // original index of the new sample 0
};

AlignedTrack align_to_first_apex(const DiscretizedTrack& track, const CurvatureField& field);

} // namespace lapsim
