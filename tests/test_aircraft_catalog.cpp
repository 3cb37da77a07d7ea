/**
 * @file test_aircraft_catalog.cpp
 * @brief Aircraft catalog lookup and CSV loading tests.
 * @author Watosn
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "sarzone/catalog/aircraft_catalog.hpp"

namespace {

std::filesystem::path make_catalog_file() {
  const auto path = std::filesystem::temp_directory_path() /
                    ("sarzone_catalog_test_" + std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count()) +
                     "_" + std::to_string(std::random_device{}()) + ".csv");
  std::ofstream out(path);
  out << "key,name,glide_ratio,max_range_nm,cruise_speed_kt,fuel_endurance_h,emergency_descent_rate_fpm\n";
  out << "# local fleet\n";
  out << "PA28, Piper Cherokee, 9.5, 600, 110, 5.0, 1200\n";
  out << "BAD,short row,1,2,3\n";
  out << "ZERO,Zero Glide,0,1,1,1,1000\n";
  out << "NAN,Bad Number,abc,1,1,1,1000\n";
  out << "SR22,Cirrus SR22,10.0,1000,180,6.0,1500\n";
  return path;
}

}  // namespace

int main() {
  using namespace sarzone;

  const auto builtin = catalog::AircraftCatalog::builtin();
  if (builtin.entries().size() != 8U) {
    spdlog::error("unexpected built-in catalog size: {}", builtin.entries().size());
    return 1;
  }
  const auto c172 = builtin.find("c172");
  if (!c172.has_value() || c172->glide_ratio != 9.0 || c172->emergency_descent_rate_fpm != 1500.0 ||
      c172->cruise_speed_kt != 122.0 || c172->name != "Small Single-Engine (Cessna 172)") {
    spdlog::error("C172 lookup mismatch");
    return 2;
  }
  const auto b777 = builtin.find("Wide-Body Airliner (Boeing 777)");
  if (!b777.has_value() || b777->glide_ratio != 19.0 || b777->emergency_descent_rate_fpm != 4500.0) {
    spdlog::error("lookup by display name failed");
    return 3;
  }
  if (builtin.find("XXXX").has_value() || builtin.get_or_default("XXXX").name != c172->name) {
    spdlog::error("unknown type must fall back to the default");
    return 4;
  }
  for (const auto& e : builtin.entries()) {
    if (!(e.profile.glide_ratio > 0.0) || !(e.profile.emergency_descent_rate_fpm > 0.0)) {
      spdlog::error("built-in {} has unusable model fields", e.key);
      return 5;
    }
  }

  const auto path = make_catalog_file();
  const auto loaded = catalog::AircraftCatalog::Create(catalog::AircraftCatalog::Config{.csv_file = path});
  std::filesystem::remove(path);
  if (!loaded || loaded->entries().size() != 2U) {
    spdlog::error("csv catalog should keep 2 rows, got {}", loaded ? loaded->entries().size() : 0U);
    return 6;
  }
  const auto pa28 = loaded->find("pa28");
  if (!pa28.has_value() || pa28->name != "Piper Cherokee" || pa28->glide_ratio != 9.5 ||
      pa28->emergency_descent_rate_fpm != 1200.0 || pa28->max_range_nm != 600.0) {
    spdlog::error("csv row parse mismatch");
    return 7;
  }
  const auto sr22 = loaded->find("SR22");
  if (!sr22.has_value() || sr22->glide_ratio != 10.0 || sr22->max_range_nm != 1000.0 || sr22->cruise_speed_kt != 180.0 ||
      sr22->fuel_endurance_h != 6.0 || sr22->emergency_descent_rate_fpm != 1500.0) {
    spdlog::error("csv numeric columns mapped to the wrong fields");
    return 10;
  }
  if (loaded->get_or_default("C172").name != c172->name) {
    spdlog::error("csv catalog without the default type must fall back to the built-in one");
    return 8;
  }

  const auto missing = catalog::AircraftCatalog::Create(
      catalog::AircraftCatalog::Config{.csv_file = std::filesystem::temp_directory_path() / "sarzone_missing_catalog.csv"});
  if (!missing || !missing->empty()) {
    spdlog::error("unreadable catalog must be empty");
    return 9;
  }

  return 0;
}
