/**
 * @file test_landing_zone.cpp
 * @brief Glide-only landing zone tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "sarzone/geodesy/geodesy.hpp"
#include "sarzone/search/landing_zone.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

}  // namespace

int main() {
  using namespace sarzone;

  const core::FlightState flight{.position = core::Position{.lat_deg = 35.0, .lon_deg = -100.0},
                                 .altitude_ft = 12152.0,
                                 .ground_speed_kt = 120.0,
                                 .heading_deg = 45.0,
                                 .vertical_speed_fpm = -300.0};
  const core::AircraftProfile single{.name = "test single", .glide_ratio = 10.0, .emergency_descent_rate_fpm = 1000.0};
  const search::LandingZonePredictor predictor{};

  const auto calm = predictor.evaluate(flight, core::WindConditions{.speed_kt = 0.0, .direction_deg = 0.0}, single);
  if (calm.status != core::Status::Ok || !approx(calm.glide_distance_nm, 20.0, 1e-12) ||
      !approx(calm.glide_time_min, 12.152, 1e-12) || calm.drift_distance_nm != 0.0 ||
      !approx(calm.uncertainty_radius_nm, 2.0, 1e-12)) {
    spdlog::error("calm landing zone mismatch glide={} time={}", calm.glide_distance_nm, calm.glide_time_min);
    return 1;
  }
  const double d = geodesy::distance_nm(flight.position, calm.landing_position);
  const double brg = geodesy::initial_bearing_deg(flight.position, calm.landing_position);
  if (!approx(d, 20.0, 1e-9) || std::abs(brg - 45.0) > 1e-9) {
    spdlog::error("calm landing position off the glide path: d={} brg={}", d, brg);
    return 2;
  }

  const auto windy = predictor.evaluate(flight, core::WindConditions{.speed_kt = 30.0, .direction_deg = 270.0}, single);
  if (windy.status != core::Status::Ok || !approx(windy.drift_distance_nm, 6.076, 1e-12) ||
      !approx(windy.uncertainty_radius_nm, 2.0 + 0.2 * 6.076, 1e-12)) {
    spdlog::error("windy landing zone mismatch drift={} unc={}", windy.drift_distance_nm, windy.uncertainty_radius_nm);
    return 3;
  }
  if (!approx(geodesy::distance_nm(calm.landing_position, windy.landing_position), 6.076, 1e-9)) {
    spdlog::error("wind drift not applied after the glide");
    return 4;
  }

  const auto ring = search::landing_zone_ring(windy);
  if (ring.size() != 37U) {
    spdlog::error("landing ring size mismatch: {}", ring.size());
    return 5;
  }
  for (const auto& p : ring) {
    if (!approx(geodesy::distance_nm(windy.landing_position, p), windy.uncertainty_radius_nm, 1e-9)) {
      spdlog::error("landing ring point off radius");
      return 6;
    }
  }

  auto bad = single;
  bad.emergency_descent_rate_fpm = 0.0;
  const auto failed = predictor.evaluate(flight, core::WindConditions{}, bad);
  if (failed.status != core::Status::InvalidInput || !search::landing_zone_ring(failed).empty()) {
    spdlog::error("invalid profile must fail without a ring");
    return 7;
  }

  return 0;
}
