#pragma once
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <lapsim/efficiency_map.hpp>
#include <lapsim/powertrain.hpp>

namespace lapsim {

struct VehicleEntry {
  std::string key;          // e.g., "ev"
  VehicleParams vehicle;
  Motor motor;
  double power_split = 0.0; // ICE share of power; 0 = electric only
};

// Built-in tiny catalog (default/fallback).
const std::vector<VehicleEntry>& vehicle_catalog();

// Lookup helpers
std::optional<VehicleEntry> vehicle_by_key(const std::string& key);
std::optional<VehicleEntry> vehicle_by_key_in(const std::vector<VehicleEntry>& cat, const std::string& key);

// Stream-based CSV loader (test-friendly; no filesystem required).
// Columns: key,mass_kg,mu,wheel_radius_m,motor_peak_torque_nm,motor_peak_power_w,
//          motor_max_rpm,motor_final_drive,motor_efficiency[,power_split]
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
std::vector<VehicleEntry> vehicle_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<VehicleEntry>> load_vehicle_catalog_csv(const std::string& path);

// Columns: omega_rad_s,torque_nm,efficiency (efficiency in (0,1]). Same row rules.
EfficiencyMap efficiency_map_from_csv_stream(std::istream& in);
std::optional<EfficiencyMap> load_efficiency_map_csv(const std::string& path);

// Columns: rpm,power_w. Same row rules.
PowerCurve power_curve_from_csv_stream(std::istream& in);
std::optional<PowerCurve> load_power_curve_csv(const std::string& path);

// Reference combustion engine used by hybrid catalog entries.
Engine default_engine();

// Electric for power_split == 0, hybrid with `engine` otherwise.
// Throws ConfigError for invalid parameters.
std::unique_ptr<Powertrain> make_powertrain(const VehicleEntry& entry, const Engine& engine = default_engine());

} // namespace lapsim
