/**
 * @file geodesy.cpp
 * @brief Spherical-earth geodesy implementation.
 * @author Watosn
 */

#include "sarzone/geodesy/geodesy.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "sarzone/core/math_utils.hpp"

namespace sarzone::geodesy {

using sarzone::core::deg_to_rad;
using sarzone::core::rad_to_deg;
using sarzone::core::constants::kEarthRadiusNm;

double wrap_longitude_deg(double lon_deg) {
  double w = std::fmod(lon_deg + 540.0, 360.0);
  if (w < 0.0) {
    w += 360.0;
  }
  if (w >= 360.0) {
    w = 0.0;
  }
  return w - 180.0;
}

double distance_nm(const sarzone::core::Position& a, const sarzone::core::Position& b) {
  const double lat1 = deg_to_rad(a.lat_deg);
  const double lat2 = deg_to_rad(b.lat_deg);
  const double dlat = lat2 - lat1;
  const double dlon = deg_to_rad(b.lon_deg - a.lon_deg);

  const double s_lat = std::sin(0.5 * dlat);
  const double s_lon = std::sin(0.5 * dlon);
  const double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;
  const double c = 2.0 * std::asin(std::sqrt(std::min(h, 1.0)));
  return kEarthRadiusNm * c;
}

double initial_bearing_deg(const sarzone::core::Position& a, const sarzone::core::Position& b) {
  const double lat1 = deg_to_rad(a.lat_deg);
  const double lat2 = deg_to_rad(b.lat_deg);
  const double dlon = deg_to_rad(b.lon_deg - a.lon_deg);

  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  return sarzone::core::wrap_360(rad_to_deg(std::atan2(y, x)));
}

sarzone::core::Position destination_point(const sarzone::core::Position& origin, double bearing_deg, double distance_nm) {
  const double lat1 = deg_to_rad(origin.lat_deg);
  const double lon1 = deg_to_rad(origin.lon_deg);
  const double brg = deg_to_rad(bearing_deg);
  const double delta = distance_nm / kEarthRadiusNm;

  const double lat2 = std::asin(std::sin(lat1) * std::cos(delta) + std::cos(lat1) * std::sin(delta) * std::cos(brg));
  const double lon2 = lon1 + std::atan2(std::sin(brg) * std::sin(delta) * std::cos(lat1),
                                        std::cos(delta) - std::sin(lat1) * std::sin(lat2));

  return sarzone::core::Position{.lat_deg = rad_to_deg(lat2), .lon_deg = wrap_longitude_deg(rad_to_deg(lon2))};
}

std::vector<sarzone::core::Position> circle_ring(const sarzone::core::Position& center,
                                                 double radius_nm,
                                                 int segments,
                                                 bool closed) {
  std::vector<sarzone::core::Position> ring;
  if (segments <= 0) {
    return ring;
  }
  ring.reserve(static_cast<std::size_t>(segments) + (closed ? 1U : 0U));
  const double step_deg = 360.0 / static_cast<double>(segments);
  for (int i = 0; i < segments; ++i) {
    ring.push_back(destination_point(center, static_cast<double>(i) * step_deg, radius_nm));
  }
  if (closed) {
    ring.push_back(ring.front());
  }
  return ring;
}

}  // namespace sarzone::geodesy
