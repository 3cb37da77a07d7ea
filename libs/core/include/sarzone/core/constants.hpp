/**
 * @file constants.hpp
 * @brief Shared unit conversions and earth model constants.
 * @author Watosn
 */
#pragma once

namespace sarzone::core::constants {

inline constexpr double kEarthRadiusNm = 3440.065;
inline constexpr double kFeetPerNauticalMile = 6076.0;
inline constexpr double kMetersPerNauticalMile = 1852.0;
inline constexpr double kMinutesPerHour = 60.0;

}  // namespace sarzone::core::constants
