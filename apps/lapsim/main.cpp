#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

#include <lapsim/config.hpp>
#include <lapsim/errors.hpp>
#include <lapsim/lap_sim.hpp>
#include <lapsim/logging.hpp>
#include <lapsim/track_geom.hpp>

using namespace lapsim;

namespace {

constexpr const char* kUsage =
    "Usage: lapsim_cli [--steps n] [--track ellipse|stadium|kidney] [--vehicle key] "
    "[--vehicles catalog.csv] [--fuel-map map.csv] [--power-curve curve.csv] "
    "[--max-iter n] [--verbose]";

std::size_t parse_count(const char* text, std::size_t fallback) {
  char* end = nullptr;
  const long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || value <= 0) return fallback;
  return static_cast<std::size_t>(value);
}

} // namespace

int main(int argc, char* argv[]) {
  LapSimConfig cfg;
  std::string track_name = "ellipse";
  std::string vehicle_key = "ev";
  std::string vehicles_path;
  std::string fuel_map_path;
  std::string power_curve_path;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--steps" && i + 1 < argc) {
      cfg.steps = parse_count(argv[++i], cfg.steps);
    } else if (arg == "--track" && i + 1 < argc) {
      track_name = argv[++i];
    } else if (arg == "--vehicle" && i + 1 < argc) {
      vehicle_key = argv[++i];
    } else if (arg == "--vehicles" && i + 1 < argc) {
      vehicles_path = argv[++i];
    } else if (arg == "--fuel-map" && i + 1 < argc) {
      fuel_map_path = argv[++i];
    } else if (arg == "--power-curve" && i + 1 < argc) {
      power_curve_path = argv[++i];
    } else if (arg == "--max-iter" && i + 1 < argc) {
      cfg.solver.max_iterations_per_sample = parse_count(argv[++i], cfg.solver.max_iterations_per_sample);
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg == "--help") {
      std::printf("%s\n", kUsage);
      return EXIT_SUCCESS;
    } else {
      std::fprintf(stderr, "ignoring unrecognized argument '%s'\n", arg.c_str());
    }
  }

  const logging::LogSinkPtr log = logging::make_console_log_sink(
      verbose ? logging::Level::Debug : logging::Level::Info);
  cfg.solver.log = log;

  std::optional<VehicleEntry> entry;
  if (!vehicles_path.empty()) {
    const auto cat = load_vehicle_catalog_csv(vehicles_path);
    if (!cat) {
      logging::log(log.get(), logging::Level::Error, "cannot open vehicle catalog " + vehicles_path);
      return EXIT_FAILURE;
    }
    entry = vehicle_by_key_in(*cat, vehicle_key);
  } else {
    entry = vehicle_by_key(vehicle_key);
  }
  if (!entry) {
    logging::log(log.get(), logging::Level::Error, "unknown vehicle '" + vehicle_key + "'");
    return EXIT_FAILURE;
  }

  const std::optional<RawTrack> track = track_preset(track_name);
  if (!track) {
    logging::log(log.get(), logging::Level::Error, "unknown track '" + track_name + "'");
    return EXIT_FAILURE;
  }

  Engine engine = default_engine();
  if (!fuel_map_path.empty()) {
    auto map = load_efficiency_map_csv(fuel_map_path);
    if (!map) {
      logging::log(log.get(), logging::Level::Error, "cannot open fuel map " + fuel_map_path);
      return EXIT_FAILURE;
    }
    engine.fuel_map = std::move(*map);
  }
  if (!power_curve_path.empty()) {
    auto curve = load_power_curve_csv(power_curve_path);
    if (!curve) {
      logging::log(log.get(), logging::Level::Error, "cannot open power curve " + power_curve_path);
      return EXIT_FAILURE;
    }
    engine.power_w = std::move(*curve);
  }

  try {
    const auto powertrain = make_powertrain(*entry, engine);
    const LapResult res = simulate_lap(*track, *powertrain, cfg);

    std::printf("vehicle %s on %s, %zu samples\n", entry->key.c_str(), track_name.c_str(),
                res.profile.size());
    std::printf("lap time: %.3fs  avg speed: %.2f m/s\n", res.lap_time_s, res.average_speed_mps);
    std::printf("energy: ICE %.1f kJ  EM %.1f kJ\n", res.total_ice_j / 1000.0, res.total_em_j / 1000.0);
    std::printf("apexes:");
    for (std::size_t a : res.apexes) std::printf(" %zu", a);
    std::printf("\nbrake points:");
    for (std::size_t b : res.brake_points) std::printf(" %zu", b);
    std::printf("\n");
    if (!res.profile.warnings.empty()) {
      std::printf("%zu efficiency lookups outside the fuel map\n", res.profile.warnings.size());
    }
    if (verbose) {
      std::printf("%5s %9s %5s %9s  %s\n", "i", "v[m/s]", "gear", "dt[s]", "limit");
      for (std::size_t i = 0; i < res.profile.size(); ++i) {
        std::printf("%5zu %9.3f %5d %9.4f  %s\n", i, res.profile.speed_mps[i], res.profile.gear[i],
                    res.profile.time_s[i], speed_limit_name(res.profile.limit[i]));
      }
    }
  } catch (const errors::LapsimError& e) {
    logging::log(log.get(), logging::Level::Error, e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
