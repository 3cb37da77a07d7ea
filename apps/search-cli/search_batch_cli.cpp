/**
 * @file search_batch_cli.cpp
 * @brief Batch search-area runner with CSV/JSON outputs.
 * @author Watosn
 */

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sarzone/catalog/aircraft_catalog.hpp"
#include "sarzone/engine/search_engine.hpp"
#include "sarzone/io/result_exporter.hpp"
#include "sarzone/sampling/uniform_source.hpp"

namespace {

struct SampleRow {
  sarzone::core::FlightState flight{};
  sarzone::core::WindConditions wind{};
};

bool parse_sample_row(const std::string& line, SampleRow& out) {
  std::stringstream ss(line);
  std::string tok;
  std::vector<double> values;
  while (std::getline(ss, tok, ',')) {
    if (tok.empty()) {
      return false;
    }
    char* end = nullptr;
    const double v = std::strtod(tok.c_str(), &end);
    if (end == tok.c_str() || (*end != '\0' && *end != '\r')) {
      return false;
    }
    values.push_back(v);
  }
  if (values.size() != 8U) {
    return false;
  }
  out.flight = sarzone::core::FlightState{.position = sarzone::core::Position{.lat_deg = values[0], .lon_deg = values[1]},
                                          .altitude_ft = values[2],
                                          .ground_speed_kt = values[3],
                                          .heading_deg = values[4],
                                          .vertical_speed_fpm = values[5]};
  out.wind = sarzone::core::WindConditions{.speed_kt = values[6], .direction_deg = values[7]};
  return true;
}

std::size_t count_above(const sarzone::core::ProbabilityField& field, double threshold) {
  std::size_t n = 0;
  for (const auto& p : field) {
    if (p.probability > threshold) {
      ++n;
    }
  }
  return n;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4 || argc > 9) {
    spdlog::error(
        "usage: search_batch_cli <input_csv> <output_file> <format:csv|json> [aircraft] [radius_mult] [samples] [seed] "
        "[catalog_csv]");
    spdlog::error("input row: lat_deg,lon_deg,alt_ft,gs_kt,hdg_deg,vs_fpm,wind_kt,wind_dir_deg");
    return 1;
  }

  const std::filesystem::path input_path = argv[1];
  const std::filesystem::path output_path = argv[2];
  const std::string format = argv[3];
  const std::string aircraft_key = (argc >= 5) ? argv[4] : std::string(sarzone::catalog::AircraftCatalog::kDefaultKey);
  const double radius_multiplier = (argc >= 6) ? std::atof(argv[5]) : 1.5;
  const long long samples = (argc >= 7) ? std::atoll(argv[6]) : 1000;
  const auto parsed_seed = (argc >= 8) ? sarzone::sampling::parse_seed(argv[7]) : std::optional<std::uint64_t>{42U};
  const std::string catalog_csv = (argc >= 9) ? argv[8] : "";
  if (format != "csv" && format != "json") {
    spdlog::error("format must be csv or json");
    return 4;
  }
  if (samples < 1) {
    spdlog::error("samples must be >= 1");
    return 4;
  }
  if (!parsed_seed.has_value()) {
    spdlog::error("seed must be a non-negative integer: {}", argv[7]);
    return 4;
  }
  const std::uint64_t seed = *parsed_seed;

  std::ifstream in(input_path);
  if (!in) {
    spdlog::error("failed to open input csv: {}", input_path.string());
    return 2;
  }
  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }

  const auto catalog = catalog_csv.empty()
                           ? std::make_unique<sarzone::catalog::AircraftCatalog>(sarzone::catalog::AircraftCatalog::builtin())
                           : sarzone::catalog::AircraftCatalog::Create(
                                 sarzone::catalog::AircraftCatalog::Config{.csv_file = catalog_csv});
  if (!catalog->find(aircraft_key).has_value()) {
    spdlog::warn("unknown aircraft '{}', falling back to {}", aircraft_key, sarzone::catalog::AircraftCatalog::kDefaultKey);
  }
  const auto aircraft = catalog->get_or_default(aircraft_key);
  const sarzone::engine::SearchEngine engine{};

  const std::time_t now = std::time(nullptr);
  if (format == "csv") {
    out << fmt::format(
        "#record_type=metadata,schema=search_batch_v1,project=sarzone,generated_unix_utc={},aircraft={},"
        "radius_mult={},samples={},seed={}\n",
        now, aircraft.name, radius_multiplier, samples, seed);
    out << "row,center_lat_deg,center_lon_deg,radius_nm,glide_nm,tti_min,horizontal_nm,drift_nm,points,"
           "points_csv,points_geojson,status\n";
  } else {
    out << fmt::format(
        "{{\"record_type\":\"metadata\",\"schema\":\"search_batch_v1\",\"project\":\"sarzone\","
        "\"generated_unix_utc\":{},\"aircraft\":\"{}\",\"radius_mult\":{},\"samples\":{},\"seed\":{}}}\n",
        now, sarzone::io::escape_json(aircraft.name), radius_multiplier, samples, seed);
  }

  std::string line;
  std::size_t line_no = 0;
  std::size_t row_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    SampleRow row{};
    if (!parse_sample_row(line, row)) {
      if (line_no == 1 && line.find("lat_deg") != std::string::npos) {
        continue;
      }
      spdlog::warn("skipping malformed row {}", line_no);
      continue;
    }

    sarzone::engine::SearchRequest request{.flight = row.flight,
                                           .wind = row.wind,
                                           .aircraft = aircraft,
                                           .radius_multiplier = radius_multiplier,
                                           .sample_count = static_cast<std::size_t>(samples)};
    sarzone::sampling::SeededUniformSource source(seed + row_no);
    const auto r = engine.evaluate(request, source);
    if (r.status != sarzone::core::Status::Ok) {
      spdlog::warn("row {} failed: {}", line_no, sarzone::core::to_string(r.status));
    }

    const auto& e = r.estimate;
    const std::size_t n_csv = count_above(r.field, sarzone::io::kCsvProbabilityThreshold);
    const std::size_t n_geojson = count_above(r.field, sarzone::io::kGeoJsonProbabilityThreshold);
    if (format == "json") {
      out << fmt::format(
          "{{\"record_type\":\"sample\",\"schema\":\"search_batch_v1\",\"row\":{},\"center_lat_deg\":{},"
          "\"center_lon_deg\":{},\"radius_nm\":{},\"glide_nm\":{},\"tti_min\":{},\"horizontal_nm\":{},\"drift_nm\":{},"
          "\"points\":{},\"points_csv\":{},\"points_geojson\":{},\"status\":\"{}\"}}\n",
          row_no, r.area.center.lat_deg, r.area.center.lon_deg, r.area.radius_nm, e.area.glide_distance_nm,
          e.time_to_impact_min, e.horizontal_distance_nm, e.drift_distance_nm, r.field.size(), n_csv, n_geojson,
          sarzone::core::to_string(r.status));
    } else {
      out << fmt::format("{},{},{},{},{},{},{},{},{},{},{},{}\n", row_no, r.area.center.lat_deg, r.area.center.lon_deg,
                         r.area.radius_nm, e.area.glide_distance_nm, e.time_to_impact_min, e.horizontal_distance_nm,
                         e.drift_distance_nm, r.field.size(), n_csv, n_geojson, sarzone::core::to_string(r.status));
    }
    ++row_no;
  }

  spdlog::info("processed {} rows into {}", row_no, output_path.string());
  return 0;
}
