#pragma once
#include <cstddef>
#include <optional>
#include <lapsim/powertrain.hpp>

namespace lapsim {

// Engine operating point outside the fuel-efficiency table. The energy is
// still produced from the nearest-sample estimate.
struct EfficiencyLookupWarning {
  std::size_t sample = 0;         // filled by the solver
  double omega_rad_s = 0.0;
  double torque_nm = 0.0;
  double efficiency_estimate = 0.0;
};

struct SegmentEnergy {
  double ice_j = 0.0;
  double em_j = 0.0;
};

struct EnergyUse {
  SegmentEnergy energy;
  std::optional<EfficiencyLookupWarning> warning;
};

class EnergyAccountant {
public:
  explicit EnergyAccountant(const Powertrain& powertrain) : pt_(powertrain) {}

  // Segment at constant acceleration `accel`, power evaluated at `speed`.
  // Non-positive power (coasting, braking) uses no energy.
  EnergyUse segment(double accel_mps2, double speed_mps, double duration_s, int gear) const;

  // Segment with fixed entry/exit speeds over distance ds (apex segments).
  EnergyUse fixed_segment(double v_entry, double v_exit, double ds, int gear) const;

  // Fuel energy for ICE power `power_w` held for `duration_s` at road speed in gear.
  EnergyUse fuel(double power_w, double speed_mps, double duration_s, int gear) const;

private:
  const Powertrain& pt_;
};

// Constant-acceleration kinematics between two speeds over ds.
inline double segment_accel(double v0, double v1, double ds) { return (v1*v1 - v0*v0) / (2.0 * ds); }
inline double segment_time(double v0, double v1, double ds) { return 2.0 * ds / (v0 + v1); }

} // namespace lapsim
