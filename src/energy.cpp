#include <lapsim/energy.hpp>
#include <algorithm>

namespace lapsim {

EnergyUse EnergyAccountant::fuel(double power_w, double speed_mps, double duration_s, int gear) const {
  EnergyUse out;
  const EfficiencyMap* map = pt_.fuel_map();
  const auto omega_engine = pt_.engine_speed_rad_s(speed_mps, gear);
  if (!(power_w > 0.0) || map == nullptr || map->empty() || !omega_engine) return out;

  // Low-speed and low-torque points take the table's lower-bound value.
  const double omega = std::max(*omega_engine, map->min_omega());
  const double torque = std::max(power_w / omega, map->min_torque());
  const EfficiencyLookup eta = map->lookup(omega, torque);
  if (!eta.in_range) {
    out.warning = EfficiencyLookupWarning{0, omega, torque, eta.efficiency};
  }
  if (eta.efficiency > 0.0) {
    out.energy.ice_j = power_w * duration_s / eta.efficiency;
  }
  return out;
}

EnergyUse EnergyAccountant::segment(double accel_mps2, double speed_mps, double duration_s, int gear) const {
  const double total = pt_.vehicle().mass_kg * accel_mps2 * speed_mps;
  if (!(total > 0.0) || !(duration_s > 0.0)) return EnergyUse{};

  const double p_ice = total * pt_.ice_power_fraction();
  const double p_em = total - p_ice;

  EnergyUse out = fuel(p_ice, speed_mps, duration_s, gear);
  out.energy.em_j = p_em * duration_s / pt_.motor().efficiency;
  return out;
}

EnergyUse EnergyAccountant::fixed_segment(double v_entry, double v_exit, double ds, int gear) const {
  if (!(v_entry + v_exit > 0.0)) return EnergyUse{};
  return segment(segment_accel(v_entry, v_exit, ds), v_entry, segment_time(v_entry, v_exit, ds), gear);
}

} // namespace lapsim
