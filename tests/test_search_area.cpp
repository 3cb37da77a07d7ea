/**
 * @file test_search_area.cpp
 * @brief Search center and radius estimation tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "sarzone/core/math_utils.hpp"
#include "sarzone/geodesy/geodesy.hpp"
#include "sarzone/search/search_area.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

}  // namespace

int main() {
  using namespace sarzone;

  const core::FlightState flight{.position = core::Position{.lat_deg = 40.0, .lon_deg = -74.0},
                                 .altitude_ft = 30000.0,
                                 .ground_speed_kt = 450.0,
                                 .heading_deg = 90.0,
                                 .vertical_speed_fpm = -4000.0};
  const core::WindConditions wind{.speed_kt = 15.0, .direction_deg = 180.0};
  const core::AircraftProfile jet{.name = "Narrow-Body Airliner (Boeing 737)",
                                  .glide_ratio = 17.0,
                                  .emergency_descent_rate_fpm = 4000.0,
                                  .cruise_speed_kt = 470.0,
                                  .fuel_endurance_h = 6.0,
                                  .max_range_nm = 3400.0};
  const search::SearchAreaEstimator estimator{};

  const auto r = estimator.evaluate(flight, wind, jet, 2.0);
  if (r.status != core::Status::Ok) {
    spdlog::error("estimate failed: {}", core::to_string(r.status));
    return 1;
  }
  if (!approx(r.time_to_impact_min, 7.5, 1e-12) || r.descent_basis != envelope::DescentBasis::ObservedDescent ||
      !approx(r.horizontal_distance_nm, 56.25, 1e-12) || !approx(r.drift_distance_nm, 1.875, 1e-12) ||
      !approx(r.wind_uncertainty_nm, 0.375, 1e-12)) {
    spdlog::error("intermediate mismatch tti={} horiz={} drift={}", r.time_to_impact_min, r.horizontal_distance_nm,
                  r.drift_distance_nm);
    return 2;
  }
  if (!approx(r.area.glide_distance_nm, 83.9368, 1e-6) || !approx(r.base_radius_nm, r.area.glide_distance_nm, 1e-15) ||
      !approx(r.area.radius_nm, 168.6236, 1e-5)) {
    spdlog::error("radius mismatch glide={} radius={}", r.area.glide_distance_nm, r.area.radius_nm);
    return 3;
  }

  const double flown = geodesy::distance_nm(flight.position, r.initial_center);
  const double flown_brg = geodesy::initial_bearing_deg(flight.position, r.initial_center);
  const double drifted = geodesy::distance_nm(r.initial_center, r.area.center);
  const double drift_brg = geodesy::initial_bearing_deg(r.initial_center, r.area.center);
  if (!approx(flown, 56.25, 1e-9) || std::abs(flown_brg - 90.0) > 1e-9 || !approx(drifted, 1.875, 1e-9) ||
      std::abs(drift_brg - 180.0) > 1e-9) {
    spdlog::error("center projection mismatch flown={} brg={} drift={} brg={}", flown, flown_brg, drifted, drift_brg);
    return 4;
  }

  const auto r1 = estimator.evaluate(flight, wind, jet, 1.0);
  const auto r3 = estimator.evaluate(flight, wind, jet, 3.0);
  if (!approx(r3.area.radius_nm, 3.0 * r1.area.radius_nm, 1e-12) ||
      r3.area.center.lat_deg != r1.area.center.lat_deg || r3.area.center.lon_deg != r1.area.center.lon_deg) {
    spdlog::error("radius must scale linearly with the multiplier and leave the center alone");
    return 5;
  }

  auto slow = flight;
  slow.ground_speed_kt = 0.0;
  slow.vertical_speed_fpm = 0.0;
  const auto rs = estimator.evaluate(slow, core::WindConditions{}, jet, 1.0);
  if (rs.status != core::Status::Ok || rs.descent_basis != envelope::DescentBasis::EmergencyDescent ||
      !approx(rs.time_to_impact_min, 7.5, 1e-12) || !approx(rs.area.radius_nm, rs.area.glide_distance_nm, 1e-15) ||
      !approx(rs.area.center.lat_deg, flight.position.lat_deg, 1e-12)) {
    spdlog::error("stationary level aircraft must be bounded by glide range around its position");
    return 6;
  }

  auto fast = flight;
  fast.ground_speed_kt = 900.0;
  const auto rf = estimator.evaluate(fast, core::WindConditions{}, jet, 1.0);
  if (!approx(rf.base_radius_nm, 112.5, 1e-12)) {
    spdlog::error("flown distance must dominate when longer than glide: {}", rf.base_radius_nm);
    return 7;
  }

  if (estimator.evaluate(flight, wind, jet, 0.9).status != core::Status::InvalidInput) {
    spdlog::error("multiplier below 1 must be rejected");
    return 8;
  }
  auto bad_heading = flight;
  bad_heading.heading_deg = 360.0;
  auto bad_lat = flight;
  bad_lat.position.lat_deg = 91.0;
  auto bad_alt = flight;
  bad_alt.altitude_ft = -10.0;
  auto bad_jet = jet;
  bad_jet.glide_ratio = 0.0;
  if (estimator.evaluate(bad_heading, wind, jet, 1.0).status != core::Status::InvalidInput ||
      estimator.evaluate(bad_lat, wind, jet, 1.0).status != core::Status::InvalidInput ||
      estimator.evaluate(bad_alt, wind, jet, 1.0).status != core::Status::InvalidInput ||
      estimator.evaluate(flight, wind, bad_jet, 1.0).status != core::Status::InvalidInput ||
      estimator.evaluate(flight, core::WindConditions{.speed_kt = 10.0, .direction_deg = -1.0}, jet, 1.0).status !=
          core::Status::InvalidInput ||
      estimator.evaluate(flight, core::WindConditions{.speed_kt = -1.0, .direction_deg = 0.0}, jet, 1.0).status !=
          core::Status::InvalidInput) {
    spdlog::error("out-of-range inputs must be rejected");
    return 9;
  }

  return 0;
}
