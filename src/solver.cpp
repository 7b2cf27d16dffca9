#include <lapsim/solver.hpp>
#include <lapsim/errors.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numeric>
#include <optional>
#include <sstream>
#include <utility>

namespace lapsim {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// Non-finite candidates never bind.
double finite_or_inf(double v) {
  return std::isfinite(v) ? v : kInf;
}

// Speed after ds at constant acceleration a >= 0.
double reach(double v0, double a, double ds) {
  const double v2 = v0*v0 + 2.0*a*ds;
  return v2 > 0.0 ? std::sqrt(v2) : 0.0;
}

} // namespace

const char* speed_limit_name(SpeedLimit limit) {
  switch (limit) {
    case SpeedLimit::Apex:             return "apex";
    case SpeedLimit::Torque:           return "torque";
    case SpeedLimit::CombinedTraction: return "combined traction";
    case SpeedLimit::LateralTraction:  return "lateral traction";
    case SpeedLimit::RpmCeiling:       return "rpm ceiling";
  }
  return "unknown";
}

double VelocityProfile::lap_time() const {
  return std::accumulate(time_s.begin(), time_s.end(), 0.0);
}

VelocityProfileSolver::VelocityProfileSolver(const Powertrain& powertrain, SolverConfig config)
  : pt_(powertrain), energy_(powertrain), config_(std::move(config)) {}

void VelocityProfileSolver::log_(logging::Level level, const std::string& message) const {
  logging::log(config_.log.get(), level, message);
}

VelocityProfileSolver::Step VelocityProfileSolver::step_(double v_in, double ap, int gear,
                                                         double roc, double ds) const {
  const PowertrainLimits lim = pt_.limits(v_in, gear);
  const double alim = pt_.traction_limit();

  // Longitudinal grip left after the lateral demand; none once ap >= alim.
  const double margin = alim*alim - ap*ap;
  const double a_trac = margin > 0.0 ? std::sqrt(margin) : 0.0;

  const std::array<std::pair<double, SpeedLimit>, 4> candidates{{
    { finite_or_inf(reach(v_in, lim.accel_mps2, ds)), SpeedLimit::Torque },
    { finite_or_inf(reach(v_in, a_trac, ds)),          SpeedLimit::CombinedTraction },
    { finite_or_inf(std::sqrt(alim * roc)),            SpeedLimit::LateralTraction },
    { finite_or_inf(lim.max_speed_mps),                SpeedLimit::RpmCeiling },
  }};

  std::pair<double, SpeedLimit> best = candidates.front();
  for (const auto& c : candidates) {
    if (c.first < best.first) best = c;
  }

  Step s;
  s.speed = best.first;
  s.limit = best.second;
  s.gear = lim.gear;
  s.time = segment_time(v_in, s.speed, ds);
  s.energy = energy_.segment(segment_accel(v_in, s.speed, ds), s.speed, s.time, lim.gear);

  if (lim.gear != gear) {
    std::ostringstream os;
    os << "shift " << gear << " -> " << lim.gear << " at " << v_in << " m/s";
    log_(logging::Level::Debug, os.str());
  }
  return s;
}

VelocityProfile VelocityProfileSolver::solve(const std::vector<double>& radius,
                                             const std::vector<std::size_t>& apexes,
                                             double ds) const {
  const std::size_t n = radius.size();
  if (n < 3) throw GeometryError("velocity profile needs at least 3 samples");
  if (!(ds > 0.0)) throw GeometryError("sample spacing must be positive");
  if (apexes.empty()) throw GeometryError("velocity profile needs at least one apex");
  for (std::size_t k = 0; k < apexes.size(); ++k) {
    if (apexes[k] >= n || (k > 0 && apexes[k] <= apexes[k-1])) {
      throw GeometryError("apex indices must be ascending and within the track");
    }
  }
  for (double r : radius) {
    if (!(r > 0.0)) throw GeometryError("radius of curvature must be positive");
  }

  const double alim = pt_.traction_limit();
  const std::size_t m = apexes.size();

  VelocityProfile out;
  out.speed_mps.assign(n, 0.0);
  out.gear.assign(n, pt_.lowest_gear());
  out.energy.assign(n, SegmentEnergy{});
  out.time_s.assign(n, 0.0);
  out.limit.assign(n, SpeedLimit::Torque);

  auto& v = out.speed_mps;
  auto& gear = out.gear;
  // Exit speed each segment record was computed with, and its lookup warning.
  std::vector<double> exit_speed(n, 0.0);
  std::vector<std::optional<EfficiencyLookupWarning>> pending(n);

  for (std::size_t a : apexes) {
    const double v_trac = std::sqrt(alim * radius[a]);
    const PowertrainLimits lim = pt_.limits(v_trac, 0);
    v[a] = std::min(v_trac, lim.max_speed_mps);
    gear[a] = lim.gear;
    out.limit[a] = SpeedLimit::Apex;
    if (!(v[a] > 0.0) || !std::isfinite(v[a])) {
      throw GeometryError("apex " + std::to_string(a) + " has no finite corner speed");
    }
  }
  // The lap starts in the lowest gear.
  gear[0] = pt_.lowest_gear();

  std::size_t unset = static_cast<std::size_t>(std::count(v.begin(), v.end(), 0.0));

  // Segment `at` -> `at+1` recorded from step `s`.
  auto record = [&](std::size_t at, const Step& s, double v_exit) {
    out.time_s[at] = s.time;
    out.energy[at] = s.energy.energy;
    pending[at] = s.energy.warning;
    exit_speed[at] = v_exit;
  };

  const std::size_t cap = config_.max_iterations_per_sample * n;
  SolverState state = SolverState::Accelerating;
  std::size_t i = 0;
  std::size_t apex_idx = 0;
  bool done = false;

  while (!done) {
    if (++out.iterations > cap) {
      throw ConvergenceError("velocity profile did not settle after " + std::to_string(cap)
                             + " iterations", "solver");
    }

    if (state == SolverState::Accelerating) {
      const std::size_t next = (i + 1) % n;
      if (v[next] == 0.0) {
        const double ap = v[i]*v[i] / radius[next];
        if (ap < alim) {
          const Step s = step_(v[i], ap, gear[i], radius[next], ds);
          v[next] = s.speed;
          gear[next] = s.gear;
          out.limit[next] = s.limit;
          record(i, s, s.speed);
          --unset;
          i = next;
        } else {
          state = SolverState::Braking;
          apex_idx = (apex_idx + 1) % m;
          std::ostringstream os;
          os << "losing traction at i=" << i << ", braking back from apex " << apex_idx
             << " (i=" << apexes[apex_idx] << ")";
          log_(logging::Level::Debug, os.str());
          i = apexes[apex_idx];
        }
      } else if (unset > 0) {
        // Reached the next apex without braking.
        i = next;
        apex_idx = (apex_idx + 1) % m;
      } else {
        log_(logging::Level::Debug, "reached end of track");
        done = true;
      }
    } else {
      const std::size_t prev = (i + n - 1) % n;
      const double ap = v[i]*v[i] / radius[prev];
      if (v[prev] == 0.0) {
        const Step s = step_(v[i], ap, gear[i], radius[prev], ds);
        v[prev] = s.speed;
        gear[prev] = s.gear;
        out.limit[prev] = s.limit;
        record(prev, s, v[i]);
        --unset;
        i = prev;
      } else if (ap > alim) {
        std::ostringstream os;
        os << "losing traction backward at i=" << i << ", accelerating from apex " << apex_idx;
        log_(logging::Level::Debug, os.str());
        state = SolverState::Accelerating;
        i = apexes[apex_idx];
      } else {
        const Step s = step_(v[i], ap, gear[i], radius[prev], ds);
        if (s.speed < v[prev] * (1.0 - config_.overwrite_tolerance)) {
          v[prev] = s.speed;
          gear[prev] = s.gear;
          out.limit[prev] = s.limit;
          record(prev, s, v[i]);
          i = prev;
        } else {
          std::ostringstream os;
          os << "brake point at i=" << prev << ", accelerating from apex " << apex_idx;
          log_(logging::Level::Debug, os.str());
          state = SolverState::Accelerating;
          i = apexes[apex_idx];
        }
      }
    }
  }

  // Apex segments have both end speeds fixed; so do segments whose exit speed
  // was lowered by a later braking pass.
  for (std::size_t k = 0; k < n; ++k) {
    const std::size_t next = (k + 1) % n;
    const bool is_apex = std::binary_search(apexes.begin(), apexes.end(), k);
    if (is_apex || exit_speed[k] != v[next]) {
      const EnergyUse e = energy_.fixed_segment(v[k], v[next], ds, gear[k]);
      out.time_s[k] = segment_time(v[k], v[next], ds);
      out.energy[k] = e.energy;
      pending[k] = e.warning;
    }
  }

  // Coasting and braking consume nothing.
  for (std::size_t k = 0; k < n; ++k) {
    if (v[k] > v[(k + 1) % n]) {
      out.energy[k] = SegmentEnergy{};
      pending[k].reset();
    }
  }

  for (std::size_t k = 0; k < n; ++k) {
    if (!pending[k]) continue;
    EfficiencyLookupWarning w = *pending[k];
    w.sample = k;
    std::ostringstream os;
    os << "ICE operating point outside the efficiency table at i=" << k
       << " (omega=" << w.omega_rad_s << " rad/s, torque=" << w.torque_nm
       << " Nm), using eta=" << w.efficiency_estimate;
    log_(logging::Level::Warning, os.str());
    out.warnings.push_back(w);
  }
  return out;
}

} // namespace lapsim
