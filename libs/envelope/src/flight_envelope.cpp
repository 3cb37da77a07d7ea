/**
 * @file flight_envelope.cpp
 * @brief Flight envelope approximations implementation.
 * @author Watosn
 */

#include "sarzone/envelope/flight_envelope.hpp"

#include <cmath>

#include "sarzone/core/constants.hpp"

namespace sarzone::envelope {

double glide_distance_nm(double altitude_ft, double glide_ratio) {
  return (altitude_ft / sarzone::core::constants::kFeetPerNauticalMile) * glide_ratio;
}

TimeToImpactResult time_to_impact(double altitude_ft, double vertical_speed_fpm, double emergency_descent_rate_fpm) {
  if (!std::isfinite(altitude_ft) || !std::isfinite(vertical_speed_fpm) || !std::isfinite(emergency_descent_rate_fpm)) {
    return TimeToImpactResult{.status = sarzone::core::Status::InvalidInput};
  }
  if (altitude_ft < 0.0 || emergency_descent_rate_fpm <= 0.0) {
    return TimeToImpactResult{.status = sarzone::core::Status::InvalidInput};
  }

  if (vertical_speed_fpm < 0.0) {
    return TimeToImpactResult{.minutes = altitude_ft / std::abs(vertical_speed_fpm),
                              .basis = DescentBasis::ObservedDescent,
                              .status = sarzone::core::Status::Ok};
  }
  return TimeToImpactResult{.minutes = altitude_ft / emergency_descent_rate_fpm,
                            .basis = DescentBasis::EmergencyDescent,
                            .status = sarzone::core::Status::Ok};
}

}  // namespace sarzone::envelope
