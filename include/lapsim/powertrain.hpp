#pragma once
#include <functional>
#include <optional>
#include <utility>
#include <vector>
#include <lapsim/efficiency_map.hpp>

namespace lapsim {

struct VehicleParams {
  double mass_kg = 0.0;
  double gravity_mps2 = 9.81;
  double mu = 1.0;              // tire friction coefficient
  double wheel_radius_m = 0.0;
};

struct Motor {
  double peak_torque_nm = 0.0;
  double peak_power_w = 0.0;    // informational; acceleration is torque-limited only
  double max_rpm = 0.0;
  double final_drive = 1.0;     // motor revs per wheel rev
  double efficiency = 1.0;      // fraction (0, 1]
};

// Piecewise-linear engine power curve, clamped at both ends.
class PowerCurve {
public:
  PowerCurve() = default;
  explicit PowerCurve(std::vector<std::pair<double, double>> rpm_power_w);

  double operator()(double rpm) const;
  bool empty() const { return pts_.empty(); }
  const std::vector<std::pair<double, double>>& points() const { return pts_; }

private:
  std::vector<std::pair<double, double>> pts_;
};

struct Engine {
  double min_rpm = 0.0;
  double max_rpm = 0.0;
  double primary_ratio = 1.0;
  double final_ratio = 1.0;
  std::vector<double> gear_ratios;                // gear 1 first
  std::function<double(double rpm)> power_w;      // brake power at rpm
  EfficiencyMap fuel_map;                         // (omega, torque) -> efficiency

  int gear_count() const { return static_cast<int>(gear_ratios.size()); }
  // Engine revs per wheel rev in `gear` (1-based).
  double overall_ratio(int gear) const {
    return gear_ratios[static_cast<std::size_t>(gear - 1)] * primary_ratio * final_ratio;
  }
};

struct PowertrainLimits {
  double accel_mps2 = 0.0;      // usable longitudinal acceleration
  double max_speed_mps = 0.0;   // rpm ceiling as road speed
  int gear = 1;
};

// Capability consumed by the velocity solver and the energy accountant.
class Powertrain {
public:
  Powertrain(VehicleParams vehicle, Motor motor);
  virtual ~Powertrain() = default;

  // Limits for the next step given the current speed and engaged gear
  // (gear 0 = none engaged yet).
  virtual PowertrainLimits limits(double speed_mps, int gear) const = 0;

  virtual int lowest_gear() const { return 1; }
  virtual int gear_count() const { return 1; }
  // Fraction of propulsive power supplied by the combustion engine.
  virtual double ice_power_fraction() const { return 0.0; }
  // Crankshaft speed at road speed in gear; nullopt without an engine.
  virtual std::optional<double> engine_speed_rad_s(double, int) const { return std::nullopt; }
  virtual const EfficiencyMap* fuel_map() const { return nullptr; }

  const VehicleParams& vehicle() const { return vehicle_; }
  const Motor& motor() const { return motor_; }

  // Combined (friction circle) traction limit mu * g.
  double traction_limit() const { return vehicle_.mu * vehicle_.gravity_mps2; }
  double wheel_rpm(double speed_mps) const;
  double road_speed(double wheel_rpm) const;

protected:
  double motor_wheel_torque_() const { return motor_.peak_torque_nm * motor_.final_drive; }
  double motor_wheel_max_rpm_() const { return motor_.max_rpm / motor_.final_drive; }

  VehicleParams vehicle_;
  Motor motor_;
};

class ElectricPowertrain final : public Powertrain {
public:
  ElectricPowertrain(VehicleParams vehicle, Motor motor);

  PowertrainLimits limits(double speed_mps, int gear) const override;
};

class HybridPowertrain final : public Powertrain {
public:
  // Upper edge of the usable rpm band as a fraction of max rpm.
  static constexpr double kShiftRpmFraction = 0.95;

  HybridPowertrain(VehicleParams vehicle, Motor motor, Engine engine, double power_split);

  PowertrainLimits limits(double speed_mps, int gear) const override;
  int gear_count() const override { return engine_.gear_count(); }
  double ice_power_fraction() const override { return power_split_; }
  std::optional<double> engine_speed_rad_s(double speed_mps, int gear) const override;
  const EfficiencyMap* fuel_map() const override { return &engine_.fuel_map; }

  const Engine& engine() const { return engine_; }

private:
  Engine engine_;
  double power_split_;
};

} // namespace lapsim
