/**
 * @file aircraft_catalog.cpp
 * @brief Aircraft profile lookup implementation.
 * @author Watosn
 */

#include "sarzone/catalog/aircraft_catalog.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace sarzone::catalog {
namespace {

constexpr std::size_t kCatalogColumns = 7;
// key and name precede the numeric columns
constexpr std::size_t kNumericColumnOffset = 2;

AircraftCatalog::Entry make_entry(const char* key,
                                  const char* name,
                                  double glide_ratio,
                                  double max_range_nm,
                                  double cruise_speed_kt,
                                  double fuel_endurance_h,
                                  double emergency_descent_rate_fpm) {
  return AircraftCatalog::Entry{.key = key,
                                .profile = sarzone::core::AircraftProfile{.name = name,
                                                                          .glide_ratio = glide_ratio,
                                                                          .emergency_descent_rate_fpm = emergency_descent_rate_fpm,
                                                                          .cruise_speed_kt = cruise_speed_kt,
                                                                          .fuel_endurance_h = fuel_endurance_h,
                                                                          .max_range_nm = max_range_nm}};
}

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1U);
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(trim(token));
  }
  return fields;
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0';
}

}  // namespace

AircraftCatalog AircraftCatalog::builtin() {
  return AircraftCatalog(std::vector<Entry>{
      make_entry("C172", "Small Single-Engine (Cessna 172)", 9.0, 800.0, 122.0, 5.0, 1500.0),
      make_entry("BE58", "Twin-Engine Piston (Beechcraft Baron)", 10.0, 1500.0, 200.0, 6.0, 1800.0),
      make_entry("C25B", "Small Business Jet (Citation CJ3)", 15.0, 2000.0, 415.0, 4.5, 3000.0),
      make_entry("GLF4", "Medium Business Jet (Gulfstream G450)", 17.0, 4350.0, 476.0, 9.0, 3500.0),
      make_entry("E75L", "Regional Airliner (Embraer E175)", 18.0, 2200.0, 447.0, 4.5, 3500.0),
      make_entry("B737", "Narrow-Body Airliner (Boeing 737)", 17.0, 3400.0, 470.0, 6.0, 4000.0),
      make_entry("B772", "Wide-Body Airliner (Boeing 777)", 19.0, 7700.0, 490.0, 14.0, 4500.0),
      // Autorotation glide.
      make_entry("B06", "Helicopter (Bell 206)", 4.0, 430.0, 122.0, 3.0, 1500.0),
  });
}

std::unique_ptr<AircraftCatalog> AircraftCatalog::Create(const Config& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    return std::make_unique<AircraftCatalog>(std::vector<Entry>{});
  }

  std::vector<Entry> entries;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    if (trim(line).empty() || line.front() == '#') {
      continue;
    }
    if (!header_consumed) {
      header_consumed = true;
      if (line.find("glide_ratio") != std::string::npos) {
        continue;
      }
    }

    const auto fields = split_csv_line(line);
    if (fields.size() != kCatalogColumns || fields[0].empty()) {
      continue;
    }
    std::array<double, kCatalogColumns - kNumericColumnOffset> values{};
    bool ok = true;
    for (std::size_t i = 0; i < values.size(); ++i) {
      ok = ok && parse_double(fields[kNumericColumnOffset + i], values[i]);
    }
    if (!ok || !(values[0] > 0.0) || !(values[4] > 0.0)) {
      continue;
    }
    entries.push_back(make_entry(fields[0].c_str(), fields[1].c_str(), values[0], values[1], values[2], values[3], values[4]));
  }
  return std::make_unique<AircraftCatalog>(std::move(entries));
}

std::optional<sarzone::core::AircraftProfile> AircraftCatalog::find(std::string_view key_or_name) const {
  for (const auto& e : entries_) {
    if (iequals(e.key, key_or_name) || e.profile.name == key_or_name) {
      return e.profile;
    }
  }
  return std::nullopt;
}

sarzone::core::AircraftProfile AircraftCatalog::get_or_default(std::string_view key_or_name) const {
  if (const auto hit = find(key_or_name)) {
    return *hit;
  }
  if (const auto fallback = find(kDefaultKey)) {
    return *fallback;
  }
  return *builtin().find(kDefaultKey);
}

}  // namespace sarzone::catalog
