#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <lapsim/energy.hpp>
#include <lapsim/logging.hpp>
#include <lapsim/powertrain.hpp>

namespace lapsim {

// Bound that decided a sample's speed.
enum class SpeedLimit : int {
  Apex = 0,          // fixed corner speed at an apex
  Torque,
  CombinedTraction,  // friction circle minus lateral demand
  LateralTraction,
  RpmCeiling,
};

const char* speed_limit_name(SpeedLimit limit);

enum class SolverState : int {
  Accelerating = 0,  // cursor moves forward from an apex
  Braking,           // cursor moves backward from the next apex
};

struct SolverConfig {
  // Loop iterations allowed per sample before ConvergenceError.
  std::size_t max_iterations_per_sample = 50;
  // A braking candidate must undercut the stored speed by this relative margin.
  double overwrite_tolerance = 1e-12;
  logging::LogSinkPtr log;   // optional; state narration and lookup warnings
};

// One circular pass. time_s[i], energy[i] and limit[i] describe the segment
// leaving sample i (i -> i+1, wrapping at the end).
struct VelocityProfile {
  std::vector<double> speed_mps;
  std::vector<int> gear;
  std::vector<SegmentEnergy> energy;
  std::vector<double> time_s;
  std::vector<SpeedLimit> limit;      // bound that produced speed_mps[i]
  std::vector<EfficiencyLookupWarning> warnings;
  std::size_t iterations = 0;

  std::size_t size() const { return speed_mps.size(); }
  double lap_time() const;
};

class VelocityProfileSolver {
public:
  explicit VelocityProfileSolver(const Powertrain& powertrain, SolverConfig config = {});

  // radius: per-sample radius of curvature (aligned so apexes[0] == 0).
  // apexes: ascending sample indices of the corner apexes.
  // Throws GeometryError on inconsistent inputs, ConvergenceError when the
  // forward/backward alternation exceeds the iteration cap.
  VelocityProfile solve(const std::vector<double>& radius,
                        const std::vector<std::size_t>& apexes,
                        double ds) const;

  const SolverConfig& config() const { return config_; }

private:
  struct Step {
    double speed = 0.0;
    int gear = 1;
    SpeedLimit limit = SpeedLimit::Torque;
    double time = 0.0;
    EnergyUse energy;
  };

  // Speed reached one sample away from `v_in` under lateral demand `ap`,
  // arriving at a sample of radius `roc`.
  Step step_(double v_in, double ap, int gear, double roc, double ds) const;
  void log_(logging::Level level, const std::string& message) const;

  const Powertrain& pt_;
  EnergyAccountant energy_;
  SolverConfig config_;
};

} // namespace lapsim
