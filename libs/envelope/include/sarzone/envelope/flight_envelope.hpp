/**
 * @file flight_envelope.hpp
 * @brief Glide distance and time-to-impact approximations.
 * @author Watosn
 */
#pragma once

#include <cstdint>

#include "sarzone/core/types.hpp"

namespace sarzone::envelope {

/**
 * @brief Which descent rate the time-to-impact estimate was based on.
 */
enum class DescentBasis : std::uint8_t { ObservedDescent, EmergencyDescent };

/**
 * @brief Time-to-impact output bundle.
 */
struct TimeToImpactResult {
  double minutes{};
  DescentBasis basis{DescentBasis::EmergencyDescent};
  sarzone::core::Status status{sarzone::core::Status::Ok};
};

/**
 * @brief Unpowered glide range: `(altitude_ft / 6076) * glide_ratio`.
 * @return Distance in nautical miles. Linear in both arguments.
 */
[[nodiscard]] double glide_distance_nm(double altitude_ft, double glide_ratio);

/**
 * @brief Minutes until the aircraft reaches the surface.
 *
 * A descending state uses the observed vertical speed. Level or climbing states are
 * assumed to convert immediately into an emergency descent at the type's rated rate.
 * @param altitude_ft Altitude above the surface, >= 0.
 * @param vertical_speed_fpm Observed vertical speed, negative when descending.
 * @param emergency_descent_rate_fpm Rated emergency descent rate, > 0.
 */
[[nodiscard]] TimeToImpactResult time_to_impact(double altitude_ft,
                                                double vertical_speed_fpm,
                                                double emergency_descent_rate_fpm);

}  // namespace sarzone::envelope
