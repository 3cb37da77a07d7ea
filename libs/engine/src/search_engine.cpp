/**
 * @file search_engine.cpp
 * @brief End-to-end search request evaluation implementation.
 * @author Watosn
 */

#include "sarzone/engine/search_engine.hpp"

#include <cmath>
#include <initializer_list>
#include <utility>

#include "sarzone/search/input_checks.hpp"

namespace sarzone::engine {

sarzone::core::Status validate_request(const SearchRequest& request) {
  using sarzone::core::Status;
  if (!std::isfinite(request.radius_multiplier) || request.radius_multiplier < 1.0 || request.sample_count < 1U) {
    return Status::InvalidInput;
  }
  for (const Status s : {sarzone::search::check_flight_state(request.flight), sarzone::search::check_wind(request.wind),
                         sarzone::search::check_profile(request.aircraft)}) {
    if (s != Status::Ok) {
      return s;
    }
  }
  return Status::Ok;
}

SearchResult SearchEngine::evaluate(const SearchRequest& request, sarzone::core::IUniformSource& source) const {
  using sarzone::core::Status;

  const Status valid = validate_request(request);
  if (valid != Status::Ok) {
    return SearchResult{.status = valid};
  }

  const auto estimate = estimator_.evaluate(request.flight, request.wind, request.aircraft, request.radius_multiplier);
  if (estimate.status != Status::Ok) {
    return SearchResult{.status = estimate.status};
  }
  if (!(estimate.area.radius_nm > 0.0)) {
    return SearchResult{.estimate = estimate, .status = Status::DegenerateGeometry};
  }

  auto sampled = sampler_.evaluate(
      sarzone::sampling::ProbabilityFieldRequest{.area = estimate.area,
                                                 .sample_count = request.sample_count,
                                                 .heading_deg = request.flight.heading_deg,
                                                 .wind_direction_deg = request.wind.direction_deg,
                                                 .wind_speed_kt = request.wind.speed_kt,
                                                 .glide_distance_nm = estimate.area.glide_distance_nm},
      source);
  if (sampled.status != Status::Ok) {
    return SearchResult{.estimate = estimate, .status = sampled.status};
  }

  return SearchResult{.area = estimate.area,
                      .field = std::move(sampled.field),
                      .estimate = estimate,
                      .bias_direction_rad = sampled.bias_direction_rad,
                      .status = Status::Ok};
}

}  // namespace sarzone::engine
