/**
 * @file geodesy.hpp
 * @brief Spherical-earth distance, bearing and destination-point primitives.
 * @author Watosn
 */
#pragma once

#include <vector>

#include "sarzone/core/constants.hpp"
#include "sarzone/core/types.hpp"

namespace sarzone::geodesy {

/**
 * @brief Wrap a longitude to [-180, 180).
 *
 * All longitudes produced by this library pass through this function.
 */
[[nodiscard]] double wrap_longitude_deg(double lon_deg);

/**
 * @brief Haversine great-circle distance on a sphere of radius kEarthRadiusNm.
 * @return Distance in nautical miles.
 */
[[nodiscard]] double distance_nm(const sarzone::core::Position& a, const sarzone::core::Position& b);

/**
 * @brief Initial great-circle bearing from `a` towards `b`.
 * @return Bearing in degrees, [0, 360).
 */
[[nodiscard]] double initial_bearing_deg(const sarzone::core::Position& a, const sarzone::core::Position& b);

/**
 * @brief Spherical direct problem: travel `distance_nm` from `origin` along `bearing_deg`.
 * @return Destination with longitude wrapped to [-180, 180).
 */
[[nodiscard]] sarzone::core::Position destination_point(const sarzone::core::Position& origin,
                                                        double bearing_deg,
                                                        double distance_nm);

/**
 * @brief Points on a circle of constant great-circle radius around `center`.
 * @param segments Number of distinct points, at bearings `i * 360 / segments`.
 * @param closed Repeat the first point at the end.
 */
[[nodiscard]] std::vector<sarzone::core::Position> circle_ring(const sarzone::core::Position& center,
                                                               double radius_nm,
                                                               int segments,
                                                               bool closed);

}  // namespace sarzone::geodesy
