/**
 * @file landing_zone.cpp
 * @brief Glide-only landing zone prediction implementation.
 * @author Watosn
 */

#include "sarzone/search/landing_zone.hpp"

#include <initializer_list>

#include "sarzone/core/constants.hpp"
#include "sarzone/envelope/flight_envelope.hpp"
#include "sarzone/geodesy/geodesy.hpp"
#include "sarzone/search/input_checks.hpp"

namespace sarzone::search {
namespace {

constexpr double kGlideUncertaintyFraction = 0.1;
constexpr double kDriftUncertaintyFraction = 0.2;

}  // namespace

LandingZoneResult LandingZonePredictor::evaluate(const sarzone::core::FlightState& flight,
                                                 const sarzone::core::WindConditions& wind,
                                                 const sarzone::core::AircraftProfile& aircraft) const {
  using sarzone::core::Status;

  for (const Status s : {check_flight_state(flight), check_wind(wind), check_profile(aircraft)}) {
    if (s != Status::Ok) {
      return LandingZoneResult{.status = s};
    }
  }

  const double glide_nm = sarzone::envelope::glide_distance_nm(flight.altitude_ft, aircraft.glide_ratio);
  const double glide_time_min = flight.altitude_ft / aircraft.emergency_descent_rate_fpm;
  const double drift_nm = wind.speed_kt * glide_time_min / sarzone::core::constants::kMinutesPerHour;

  const auto glide_end = sarzone::geodesy::destination_point(flight.position, flight.heading_deg, glide_nm);
  const auto landing = sarzone::geodesy::destination_point(glide_end, wind.direction_deg, drift_nm);

  return LandingZoneResult{
      .aircraft_position = flight.position,
      .landing_position = landing,
      .glide_distance_nm = glide_nm,
      .glide_time_min = glide_time_min,
      .drift_distance_nm = drift_nm,
      .uncertainty_radius_nm = kGlideUncertaintyFraction * glide_nm + kDriftUncertaintyFraction * drift_nm,
      .status = Status::Ok};
}

std::vector<sarzone::core::Position> landing_zone_ring(const LandingZoneResult& zone, int segments) {
  if (zone.status != sarzone::core::Status::Ok) {
    return {};
  }
  return sarzone::geodesy::circle_ring(zone.landing_position, zone.uncertainty_radius_nm, segments, true);
}

}  // namespace sarzone::search
