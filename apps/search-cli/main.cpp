/**
 * @file main.cpp
 * @brief sarzone single-request command-line entrypoint.
 * @author Watosn
 */

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sarzone/catalog/aircraft_catalog.hpp"
#include "sarzone/engine/search_engine.hpp"
#include "sarzone/io/result_exporter.hpp"
#include "sarzone/sampling/uniform_source.hpp"
#include "sarzone/search/landing_zone.hpp"

int main(int argc, char** argv) {
  if (argc < 9 || argc > 16) {
    spdlog::error(
        "usage: search_cli <lat_deg> <lon_deg> <alt_ft> <gs_kt> <hdg_deg> <vs_fpm> <wind_kt> <wind_dir_deg> [aircraft] "
        "[radius_mult] [samples] [seed] [format] [out_dir] [catalog_csv]");
    spdlog::error("aircraft: catalog key or name (default C172)");
    spdlog::error("seed: integer | random");
    spdlog::error("format: csv | geojson");
    return 1;
  }

  sarzone::engine::SearchRequest request{};
  request.flight.position = sarzone::core::Position{.lat_deg = std::atof(argv[1]), .lon_deg = std::atof(argv[2])};
  request.flight.altitude_ft = std::atof(argv[3]);
  request.flight.ground_speed_kt = std::atof(argv[4]);
  request.flight.heading_deg = std::atof(argv[5]);
  request.flight.vertical_speed_fpm = std::atof(argv[6]);
  request.wind = sarzone::core::WindConditions{.speed_kt = std::atof(argv[7]), .direction_deg = std::atof(argv[8])};

  const std::string aircraft_key = (argc >= 10) ? argv[9] : std::string(sarzone::catalog::AircraftCatalog::kDefaultKey);
  request.radius_multiplier = (argc >= 11) ? std::atof(argv[10]) : 1.5;
  const long long samples = (argc >= 12) ? std::atoll(argv[11]) : 1000;
  const std::string seed_text = (argc >= 13) ? argv[12] : "random";
  const std::string format_text = (argc >= 14) ? argv[13] : "csv";
  const std::filesystem::path out_dir = (argc >= 15) ? argv[14] : ".";
  const std::string catalog_csv = (argc >= 16) ? argv[15] : "";

  if (samples < 1) {
    spdlog::error("samples must be >= 1");
    return 1;
  }
  request.sample_count = static_cast<std::size_t>(samples);

  const auto format = sarzone::io::parse_export_format(format_text);
  if (!format.has_value()) {
    spdlog::error("format must be csv or geojson");
    return 1;
  }

  std::unique_ptr<sarzone::catalog::AircraftCatalog> catalog{};
  if (!catalog_csv.empty()) {
    catalog = sarzone::catalog::AircraftCatalog::Create(sarzone::catalog::AircraftCatalog::Config{.csv_file = catalog_csv});
    if (catalog->empty()) {
      spdlog::warn("catalog {} has no usable rows, using built-in types", catalog_csv);
      catalog = std::make_unique<sarzone::catalog::AircraftCatalog>(sarzone::catalog::AircraftCatalog::builtin());
    }
  } else {
    catalog = std::make_unique<sarzone::catalog::AircraftCatalog>(sarzone::catalog::AircraftCatalog::builtin());
  }
  if (!catalog->find(aircraft_key).has_value()) {
    spdlog::warn("unknown aircraft '{}', falling back to {}", aircraft_key, sarzone::catalog::AircraftCatalog::kDefaultKey);
  }
  request.aircraft = catalog->get_or_default(aircraft_key);

  const auto seed = (seed_text == "random") ? std::optional<std::uint64_t>{} : sarzone::sampling::parse_seed(seed_text);
  if (seed_text != "random" && !seed.has_value()) {
    spdlog::error("seed must be a non-negative integer or 'random': {}", seed_text);
    return 1;
  }
  auto source = seed.has_value() ? sarzone::sampling::SeededUniformSource(*seed)
                                 : sarzone::sampling::SeededUniformSource::from_entropy();

  const sarzone::engine::SearchEngine engine{};
  const auto result = engine.evaluate(request, source);
  if (result.status != sarzone::core::Status::Ok) {
    spdlog::error("search evaluation failed: status={}", sarzone::core::to_string(result.status));
    return 2;
  }

  const auto& e = result.estimate;
  fmt::print("aircraft=\"{}\" glide_ratio={} edr_fpm={} seed={}\n", request.aircraft.name, request.aircraft.glide_ratio,
             request.aircraft.emergency_descent_rate_fpm, source.seed());
  fmt::print("glide_nm={:.3f} tti_min={:.3f} horizontal_nm={:.3f} drift_nm={:.3f} wind_unc_nm={:.3f}\n",
             e.area.glide_distance_nm, e.time_to_impact_min, e.horizontal_distance_nm, e.drift_distance_nm,
             e.wind_uncertainty_nm);
  fmt::print("initial_center={:.6f},{:.6f} center={:.6f},{:.6f} radius_nm={:.3f}\n", e.initial_center.lat_deg,
             e.initial_center.lon_deg, result.area.center.lat_deg, result.area.center.lon_deg, result.area.radius_nm);
  fmt::print("points={} bias_rad={:.4f}\n", result.field.size(), result.bias_direction_rad);

  const auto zone = sarzone::search::LandingZonePredictor{}.evaluate(request.flight, request.wind, request.aircraft);
  if (zone.status == sarzone::core::Status::Ok) {
    fmt::print("glide_landing={:.6f},{:.6f} glide_time_min={:.2f} landing_unc_nm={:.3f}\n", zone.landing_position.lat_deg,
               zone.landing_position.lon_deg, zone.glide_time_min, zone.uncertainty_radius_nm);
  }

  const auto out_path = out_dir / sarzone::io::export_file_name(*format, std::time(nullptr));
  std::ofstream out(out_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", out_path.string());
    return 3;
  }
  out << sarzone::io::export_result(*format, result.area, result.field);
  if (!out) {
    spdlog::error("failed to write output file: {}", out_path.string());
    return 3;
  }
  spdlog::info("wrote {}", out_path.string());
  return 0;
}
