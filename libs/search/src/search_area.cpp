/**
 * @file search_area.cpp
 * @brief Search area estimation implementation.
 * @author Watosn
 */

#include "sarzone/search/search_area.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

#include "sarzone/core/constants.hpp"
#include "sarzone/geodesy/geodesy.hpp"
#include "sarzone/search/input_checks.hpp"

namespace sarzone::search {
namespace {

constexpr double kWindUncertaintyFraction = 0.2;

}  // namespace

SearchAreaResult SearchAreaEstimator::evaluate(const sarzone::core::FlightState& flight,
                                               const sarzone::core::WindConditions& wind,
                                               const sarzone::core::AircraftProfile& aircraft,
                                               double radius_multiplier) const {
  using sarzone::core::Status;

  if (!std::isfinite(radius_multiplier) || radius_multiplier < 1.0) {
    return SearchAreaResult{.status = Status::InvalidInput};
  }
  for (const Status s : {check_flight_state(flight), check_wind(wind), check_profile(aircraft)}) {
    if (s != Status::Ok) {
      return SearchAreaResult{.status = s};
    }
  }

  const double glide_nm = sarzone::envelope::glide_distance_nm(flight.altitude_ft, aircraft.glide_ratio);
  const auto tti = sarzone::envelope::time_to_impact(flight.altitude_ft, flight.vertical_speed_fpm,
                                                     aircraft.emergency_descent_rate_fpm);
  if (tti.status != Status::Ok) {
    return SearchAreaResult{.status = tti.status};
  }
  const double t_h = tti.minutes / sarzone::core::constants::kMinutesPerHour;

  const double horizontal_nm = flight.ground_speed_kt * t_h;
  const auto initial_center = sarzone::geodesy::destination_point(flight.position, flight.heading_deg, horizontal_nm);

  const double drift_nm = wind.speed_kt * t_h;
  const auto final_center = sarzone::geodesy::destination_point(initial_center, wind.direction_deg, drift_nm);

  const double base_nm = std::max(glide_nm, horizontal_nm);
  const double wind_uncertainty_nm = kWindUncertaintyFraction * drift_nm;
  const double radius_nm = (base_nm + wind_uncertainty_nm) * radius_multiplier;

  return SearchAreaResult{
      .area = sarzone::core::SearchArea{.center = final_center, .radius_nm = radius_nm, .glide_distance_nm = glide_nm},
      .initial_center = initial_center,
      .time_to_impact_min = tti.minutes,
      .descent_basis = tti.basis,
      .horizontal_distance_nm = horizontal_nm,
      .drift_distance_nm = drift_nm,
      .base_radius_nm = base_nm,
      .wind_uncertainty_nm = wind_uncertainty_nm,
      .status = Status::Ok};
}

}  // namespace sarzone::search
