/**
 * @file input_checks.cpp
 * @brief Range checks for estimator inputs.
 * @author Watosn
 */

#include "sarzone/search/input_checks.hpp"

#include <cmath>

namespace sarzone::search {
namespace {

bool is_compass_angle(double deg) { return std::isfinite(deg) && deg >= 0.0 && deg < 360.0; }

}  // namespace

sarzone::core::Status check_flight_state(const sarzone::core::FlightState& flight) {
  const auto& p = flight.position;
  if (!std::isfinite(p.lat_deg) || p.lat_deg < -90.0 || p.lat_deg > 90.0 || !std::isfinite(p.lon_deg)) {
    return sarzone::core::Status::InvalidInput;
  }
  if (!std::isfinite(flight.altitude_ft) || flight.altitude_ft < 0.0) {
    return sarzone::core::Status::InvalidInput;
  }
  if (!std::isfinite(flight.ground_speed_kt) || flight.ground_speed_kt < 0.0) {
    return sarzone::core::Status::InvalidInput;
  }
  if (!is_compass_angle(flight.heading_deg) || !std::isfinite(flight.vertical_speed_fpm)) {
    return sarzone::core::Status::InvalidInput;
  }
  return sarzone::core::Status::Ok;
}

sarzone::core::Status check_wind(const sarzone::core::WindConditions& wind) {
  if (!std::isfinite(wind.speed_kt) || wind.speed_kt < 0.0 || !is_compass_angle(wind.direction_deg)) {
    return sarzone::core::Status::InvalidInput;
  }
  return sarzone::core::Status::Ok;
}

sarzone::core::Status check_profile(const sarzone::core::AircraftProfile& aircraft) {
  if (!std::isfinite(aircraft.glide_ratio) || aircraft.glide_ratio <= 0.0) {
    return sarzone::core::Status::InvalidInput;
  }
  if (!std::isfinite(aircraft.emergency_descent_rate_fpm) || aircraft.emergency_descent_rate_fpm <= 0.0) {
    return sarzone::core::Status::InvalidInput;
  }
  return sarzone::core::Status::Ok;
}

}  // namespace sarzone::search
