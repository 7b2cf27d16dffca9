#include <lapsim/lap_sim.hpp>
#include <numeric>
#include <sstream>

namespace lapsim {

LapResult simulate_lap(const RawTrack& raw, const Powertrain& powertrain, const LapSimConfig& config) {
  const DiscretizedTrack track = discretize_track(raw, config.steps);
  const CurvatureField field = estimate_curvature(track);
  AlignedTrack aligned = align_to_first_apex(track, field);

  const VelocityProfileSolver solver(powertrain, config.solver);
  VelocityProfile profile = solver.solve(aligned.curvature.radius, aligned.apexes, aligned.track.ds);

  LapResult out;
  out.brake_points = locate_brake_points(profile.speed_mps);
  out.lap_time_s = profile.lap_time();
  const auto& v = profile.speed_mps;
  out.average_speed_mps = std::accumulate(v.begin(), v.end(), 0.0) / double(v.size());
  for (const auto& e : profile.energy) {
    out.total_ice_j += e.ice_j;
    out.total_em_j += e.em_j;
  }

  out.track = std::move(aligned.track);
  out.curvature = std::move(aligned.curvature);
  out.apexes = std::move(aligned.apexes);
  out.offset = aligned.offset;
  out.profile = std::move(profile);

  std::ostringstream os;
  os << "lap time " << out.lap_time_s << " s over " << out.profile.size() << " samples, "
     << out.apexes.size() << " apexes, " << out.brake_points.size() << " brake points";
  logging::log(config.solver.log.get(), logging::Level::Info, os.str());
  return out;
}

} // namespace lapsim
