/**
 * @file math_utils.hpp
 * @brief Shared angle helpers.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <numbers>

namespace sarzone::core {

inline constexpr double deg_to_rad(double deg) { return deg * std::numbers::pi / 180.0; }
inline constexpr double rad_to_deg(double rad) { return rad * 180.0 / std::numbers::pi; }

/**
 * @brief Wrap an angle to (-pi, pi].
 */
inline double wrap_pi(double rad) {
  constexpr double two_pi = 2.0 * std::numbers::pi;
  double w = std::fmod(rad + std::numbers::pi, two_pi);
  if (w <= 0.0) {
    w += two_pi;
  }
  return w - std::numbers::pi;
}

/**
 * @brief Wrap a compass angle to [0, 360).
 */
inline double wrap_360(double deg) {
  double w = std::fmod(deg, 360.0);
  if (w < 0.0) {
    w += 360.0;
  }
  return (w >= 360.0) ? 0.0 : w;
}

/**
 * @brief Smallest absolute angular separation between two angles, in [0, pi].
 */
inline double angular_separation(double a_rad, double b_rad) {
  const double d = std::abs(a_rad - b_rad);
  return std::min(d, 2.0 * std::numbers::pi - d);
}

}  // namespace sarzone::core
