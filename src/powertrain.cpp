#include <lapsim/powertrain.hpp>
#include <lapsim/errors.hpp>
#include <lapsim/track_geom.hpp> // kTAU
#include <algorithm>
#include <cmath>
#include <string>

namespace lapsim {

PowerCurve::PowerCurve(std::vector<std::pair<double, double>> rpm_power_w)
  : pts_(std::move(rpm_power_w)) {
  std::sort(pts_.begin(), pts_.end());
}

double PowerCurve::operator()(double rpm) const {
  if (pts_.empty()) return 0.0;
  if (rpm <= pts_.front().first) return pts_.front().second;
  if (rpm >= pts_.back().first) return pts_.back().second;
  auto it = std::upper_bound(pts_.begin(), pts_.end(), rpm,
                             [](double r, const auto& p){ return r < p.first; });
  const auto& b = *it;
  const auto& a = *(it - 1);
  const double span = b.first - a.first;
  const double t = span > 0.0 ? (rpm - a.first) / span : 0.0;
  return a.second + (b.second - a.second) * t;
}

Powertrain::Powertrain(VehicleParams vehicle, Motor motor)
  : vehicle_(vehicle), motor_(motor) {
  if (!(vehicle_.mass_kg > 0.0))        throw ConfigError("vehicle mass must be positive");
  if (!(vehicle_.gravity_mps2 > 0.0))   throw ConfigError("gravity must be positive");
  if (!(vehicle_.mu > 0.0))             throw ConfigError("friction coefficient must be positive");
  if (!(vehicle_.wheel_radius_m > 0.0)) throw ConfigError("wheel radius must be positive");
  if (!(motor_.final_drive > 0.0))      throw ConfigError("motor final drive must be positive");
  if (!(motor_.max_rpm > 0.0))          throw ConfigError("motor max rpm must be positive");
  if (motor_.peak_torque_nm < 0.0)      throw ConfigError("motor peak torque must not be negative");
  if (!(motor_.efficiency > 0.0 && motor_.efficiency <= 1.0)) {
    throw ConfigError("motor efficiency must be in (0, 1]");
  }
}

double Powertrain::wheel_rpm(double speed_mps) const {
  return speed_mps / (kTAU * vehicle_.wheel_radius_m) * 60.0;
}

double Powertrain::road_speed(double wheel_rpm) const {
  return wheel_rpm / 60.0 * (kTAU * vehicle_.wheel_radius_m);
}

ElectricPowertrain::ElectricPowertrain(VehicleParams vehicle, Motor motor)
  : Powertrain(vehicle, motor) {}

PowertrainLimits ElectricPowertrain::limits(double, int) const {
  PowertrainLimits out;
  out.accel_mps2 = motor_wheel_torque_() / (vehicle_.wheel_radius_m * vehicle_.mass_kg);
  out.max_speed_mps = road_speed(motor_wheel_max_rpm_());
  out.gear = 1;
  return out;
}

HybridPowertrain::HybridPowertrain(VehicleParams vehicle, Motor motor, Engine engine, double power_split)
  : Powertrain(vehicle, motor), engine_(std::move(engine)), power_split_(power_split) {
  if (engine_.gear_ratios.empty()) throw ConfigError("engine needs at least one gear ratio");
  for (double r : engine_.gear_ratios) {
    if (!(r > 0.0)) throw ConfigError("gear ratios must be positive");
  }
  if (!(engine_.primary_ratio > 0.0) || !(engine_.final_ratio > 0.0)) {
    throw ConfigError("engine primary/final ratios must be positive");
  }
  if (!(engine_.max_rpm > engine_.min_rpm) || engine_.min_rpm < 0.0) {
    throw ConfigError("engine rpm range is empty");
  }
  if (!engine_.power_w) throw ConfigError("engine power curve is missing");
  if (engine_.fuel_map.triangle_count() == 0) {
    throw ConfigError("engine fuel map needs at least 3 non-collinear samples");
  }
  if (!(power_split_ >= 0.0 && power_split_ <= 1.0)) {
    throw ConfigError("power split must be in [0, 1], got " + std::to_string(power_split_));
  }
}

PowertrainLimits HybridPowertrain::limits(double speed_mps, int gear) const {
  const int n_gears = engine_.gear_count();
  const double wheel = wheel_rpm(speed_mps);

  std::vector<double> rpm_at(static_cast<std::size_t>(n_gears));
  for (int g = 1; g <= n_gears; ++g) rpm_at[static_cast<std::size_t>(g - 1)] = wheel * engine_.overall_ratio(g);

  const bool engaged = gear >= 1 && gear <= n_gears;
  int gear_new = 1;
  double rpm = 0.0;
  double power = 0.0;

  if (rpm_at.front() < engine_.min_rpm) {
    // Idle: even first gear is below the band; hold and use idle power.
    gear_new = engaged ? gear : 1;
    rpm = rpm_at[static_cast<std::size_t>(gear_new - 1)];
    power = engine_.power_w(engine_.min_rpm);
  } else {
    auto in_band = [&](double r){ return r >= engine_.min_rpm && r < engine_.max_rpm * kShiftRpmFraction; };
    auto it = std::find_if(rpm_at.begin(), rpm_at.end(), in_band);
    if (it != rpm_at.end()) {
      gear_new = static_cast<int>(std::distance(rpm_at.begin(), it)) + 1;
      rpm = *it;
    } else {
      // Pinned at redline.
      gear_new = engaged ? gear : n_gears;
      rpm = engine_.max_rpm;
    }
    power = engine_.power_w(rpm);
  }

  const double omega = rpm / 60.0 * kTAU;
  const double ice_wheel_torque = omega > 0.0 ? (power / omega) * engine_.overall_ratio(gear_new) : 0.0;

  PowertrainLimits out;
  out.gear = gear_new;
  out.accel_mps2 = (motor_wheel_torque_() + ice_wheel_torque)
                 / (vehicle_.wheel_radius_m * vehicle_.mass_kg);
  const double ice_wheel_max_rpm = engine_.max_rpm / engine_.overall_ratio(gear_new);
  out.max_speed_mps = road_speed(std::min(ice_wheel_max_rpm, motor_wheel_max_rpm_()));
  return out;
}

std::optional<double> HybridPowertrain::engine_speed_rad_s(double speed_mps, int gear) const {
  const int g = std::clamp(gear, 1, engine_.gear_count());
  return wheel_rpm(speed_mps) * engine_.overall_ratio(g) / 60.0 * kTAU;
}

} // namespace lapsim
