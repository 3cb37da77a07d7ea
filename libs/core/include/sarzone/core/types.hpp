/**
 * @file types.hpp
 * @brief Core domain types for sarzone.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sarzone::core {

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, DegenerateGeometry, SamplingTimeout };

/**
 * @brief Stable lowercase identifier for a status code.
 */
inline const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::DegenerateGeometry:
      return "degenerate_geometry";
    case Status::SamplingTimeout:
      return "sampling_timeout";
    default:
      return "unknown";
  }
}

/**
 * @brief Geographic position on the spherical earth.
 */
struct Position {
  double lat_deg{};
  double lon_deg{};
};

/**
 * @brief Aircraft performance record.
 *
 * Only `glide_ratio` and `emergency_descent_rate_fpm` feed the models; the remaining
 * fields are informational.
 */
struct AircraftProfile {
  std::string name{};
  double glide_ratio{};
  double emergency_descent_rate_fpm{};
  double cruise_speed_kt{};
  double fuel_endurance_h{};
  double max_range_nm{};
};

/**
 * @brief Last known flight state.
 */
struct FlightState {
  Position position{};
  double altitude_ft{};
  double ground_speed_kt{};
  double heading_deg{};
  double vertical_speed_fpm{};
};

/**
 * @brief Surface wind. `direction_deg` is the bearing the drift is applied along.
 */
struct WindConditions {
  double speed_kt{};
  double direction_deg{};
};

/**
 * @brief Estimated search area.
 */
struct SearchArea {
  Position center{};
  double radius_nm{};
  double glide_distance_nm{};
};

/**
 * @brief One weighted sample of the probability field.
 */
struct ProbabilityPoint {
  Position position{};
  double probability{};
};

using ProbabilityField = std::vector<ProbabilityPoint>;

}  // namespace sarzone::core
