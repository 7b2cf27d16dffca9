#include <lapsim/config.hpp>
#include <algorithm>
#include <fstream>
#include <cctype>

namespace lapsim {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

// Parses every column from `first` on as a number; nullopt if any fails.
static std::optional<std::vector<double>> numeric_columns(const std::vector<std::string>& cols,
                                                          std::size_t first) {
  std::vector<double> out;
  out.reserve(cols.size() - std::min(first, cols.size()));
  for (std::size_t i = first; i < cols.size(); ++i) {
    bool ok = false;
    const double v = to_double_safe(cols[i], ok);
    if (!ok) return std::nullopt;
    out.push_back(v);
  }
  return out;
}

// Shared row loop: trims, skips blanks/comments and a leading header row.
template <class RowFn>
static void for_each_csv_row(std::istream& in, const std::string& header_key, RowFn&& fn) {
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (!header_consumed && !cols.empty() && cols[0] == header_key) {
      header_consumed = true;
      continue;
    }
    fn(cols);
  }
}

static std::optional<VehicleEntry> parse_vehicle_row(const std::vector<std::string>& cols) {
  if (cols.size() < 9 || cols.size() > 10) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;
  const auto nums = numeric_columns(cols, 1);
  if (!nums) return std::nullopt;
  const auto& x = *nums;

  VehicleEntry e;
  e.key = key;
  e.vehicle.mass_kg = x[0];
  e.vehicle.mu = x[1];
  e.vehicle.wheel_radius_m = x[2];
  e.motor.peak_torque_nm = x[3];
  e.motor.peak_power_w = x[4];
  e.motor.max_rpm = x[5];
  e.motor.final_drive = x[6];
  e.motor.efficiency = x[7];
  e.power_split = x.size() > 8 ? x[8] : 0.0;

  if (e.vehicle.mass_kg <= 0.0 || e.vehicle.mu <= 0.0 || e.vehicle.wheel_radius_m <= 0.0) return std::nullopt;
  if (e.motor.efficiency <= 0.0 || e.motor.efficiency > 1.0) return std::nullopt;
  if (e.power_split < 0.0 || e.power_split > 1.0) return std::nullopt;
  return e;
}

static std::vector<VehicleEntry> make_catalog_builtin() {
  VehicleEntry ev;
  ev.key = "ev";
  ev.vehicle = VehicleParams{300.0, 9.81, 1.0, 0.2286};
  ev.motor = Motor{200.0, 80000.0, 6000.0, 4.0, 0.90};
  ev.power_split = 0.0;

  VehicleEntry hybrid;
  hybrid.key = "hybrid";
  hybrid.vehicle = VehicleParams{350.0, 9.81, 1.2, 0.2286};
  hybrid.motor = Motor{60.0, 20000.0, 8000.0, 4.0, 0.92};
  hybrid.power_split = 0.7;

  return { ev, hybrid };
}

const std::vector<VehicleEntry>& vehicle_catalog() {
  static const std::vector<VehicleEntry> cat = make_catalog_builtin();
  return cat;
}

std::optional<VehicleEntry> vehicle_by_key(const std::string& key) {
  return vehicle_by_key_in(vehicle_catalog(), key);
}

std::optional<VehicleEntry> vehicle_by_key_in(const std::vector<VehicleEntry>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const VehicleEntry& e){ return e.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<VehicleEntry> vehicle_catalog_from_csv_stream(std::istream& in) {
  std::vector<VehicleEntry> out;
  for_each_csv_row(in, "key", [&](const std::vector<std::string>& cols) {
    if (auto row = parse_vehicle_row(cols); row.has_value()) out.push_back(*row);
  });
  return out;
}

std::optional<std::vector<VehicleEntry>> load_vehicle_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return vehicle_catalog_from_csv_stream(f);
}

EfficiencyMap efficiency_map_from_csv_stream(std::istream& in) {
  std::vector<EfficiencySample> samples;
  for_each_csv_row(in, "omega_rad_s", [&](const std::vector<std::string>& cols) {
    if (cols.size() != 3) return;
    const auto x = numeric_columns(cols, 0);
    if (!x) return;
    if ((*x)[2] <= 0.0 || (*x)[2] > 1.0) return;
    samples.push_back(EfficiencySample{(*x)[0], (*x)[1], (*x)[2]});
  });
  return EfficiencyMap(std::move(samples));
}

std::optional<EfficiencyMap> load_efficiency_map_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return efficiency_map_from_csv_stream(f);
}

PowerCurve power_curve_from_csv_stream(std::istream& in) {
  std::vector<std::pair<double, double>> pts;
  for_each_csv_row(in, "rpm", [&](const std::vector<std::string>& cols) {
    if (cols.size() != 2) return;
    const auto x = numeric_columns(cols, 0);
    if (!x || (*x)[0] < 0.0) return;
    pts.emplace_back((*x)[0], (*x)[1]);
  });
  return PowerCurve(std::move(pts));
}

std::optional<PowerCurve> load_power_curve_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return power_curve_from_csv_stream(f);
}

Engine default_engine() {
  Engine e;
  e.min_rpm = 2000.0;
  e.max_rpm = 11000.0;
  e.primary_ratio = 1.8;
  e.final_ratio = 2.5;
  e.gear_ratios = {2.6, 1.9, 1.5, 1.25, 1.08, 0.96};
  e.power_w = PowerCurve({{2000.0, 15000.0}, {6000.0, 45000.0}, {9000.0, 60000.0}, {11000.0, 55000.0}});

  // Brake thermal efficiency over crank speed (rad/s) x torque (Nm).
  const double omega[] = {200.0, 500.0, 800.0, 1200.0};
  const double torque[] = {5.0, 30.0, 55.0, 80.0};
  const double eta[4][4] = {
    {0.18, 0.24, 0.27, 0.28},
    {0.20, 0.28, 0.32, 0.33},
    {0.19, 0.27, 0.31, 0.32},
    {0.16, 0.24, 0.28, 0.29},
  };
  std::vector<EfficiencySample> samples;
  for (int i = 0; i < 4; ++i) {
    for (int j = 0; j < 4; ++j) samples.push_back({omega[i], torque[j], eta[i][j]});
  }
  e.fuel_map = EfficiencyMap(std::move(samples));
  return e;
}

std::unique_ptr<Powertrain> make_powertrain(const VehicleEntry& entry, const Engine& engine) {
  if (entry.power_split > 0.0) {
    return std::make_unique<HybridPowertrain>(entry.vehicle, entry.motor, engine, entry.power_split);
  }
  return std::make_unique<ElectricPowertrain>(entry.vehicle, entry.motor);
}

} // namespace lapsim
