/**
 * @file input_checks.hpp
 * @brief Range checks for estimator inputs.
 * @author Watosn
 */
#pragma once

#include "sarzone/core/types.hpp"

namespace sarzone::search {

/**
 * @brief Check position, altitude, ground speed, heading and vertical speed ranges.
 */
[[nodiscard]] sarzone::core::Status check_flight_state(const sarzone::core::FlightState& flight);

/**
 * @brief Check wind speed and direction ranges.
 */
[[nodiscard]] sarzone::core::Status check_wind(const sarzone::core::WindConditions& wind);

/**
 * @brief Check that the model-relevant profile fields are finite and positive.
 */
[[nodiscard]] sarzone::core::Status check_profile(const sarzone::core::AircraftProfile& aircraft);

}  // namespace sarzone::search
