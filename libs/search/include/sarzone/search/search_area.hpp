/**
 * @file search_area.hpp
 * @brief Deterministic search center and radius estimation.
 * @author Watosn
 */
#pragma once

#include "sarzone/core/types.hpp"
#include "sarzone/envelope/flight_envelope.hpp"

namespace sarzone::search {

/**
 * @brief Search area output bundle with intermediate quantities.
 */
struct SearchAreaResult {
  sarzone::core::SearchArea area{};
  sarzone::core::Position initial_center{};
  double time_to_impact_min{};
  sarzone::envelope::DescentBasis descent_basis{sarzone::envelope::DescentBasis::EmergencyDescent};
  double horizontal_distance_nm{};
  double drift_distance_nm{};
  double base_radius_nm{};
  double wind_uncertainty_nm{};
  sarzone::core::Status status{sarzone::core::Status::Ok};
};

/**
 * @brief Projects the last known position along heading and wind drift.
 *
 * The center is the point reached after flying at ground speed along the heading until
 * impact, then drifting with the wind for the same time. The radius is the larger of the
 * glide range and the flown distance, widened by 20% of the drift and scaled by the
 * caller's safety multiplier. Exactly linear in `radius_multiplier`.
 */
class SearchAreaEstimator final {
 public:
  /**
   * @brief Evaluate the search area.
   * @param flight Last known flight state.
   * @param wind Wind conditions.
   * @param aircraft Resolved aircraft profile.
   * @param radius_multiplier Safety multiplier, >= 1.
   * @return Result with `status` set; on failure no geometry is filled in.
   */
  [[nodiscard]] SearchAreaResult evaluate(const sarzone::core::FlightState& flight,
                                          const sarzone::core::WindConditions& wind,
                                          const sarzone::core::AircraftProfile& aircraft,
                                          double radius_multiplier) const;
};

}  // namespace sarzone::search
