/**
 * @file landing_zone.hpp
 * @brief Glide-only landing zone prediction.
 * @author Watosn
 */
#pragma once

#include <vector>

#include "sarzone/core/types.hpp"

namespace sarzone::search {

/**
 * @brief Landing zone output bundle.
 */
struct LandingZoneResult {
  sarzone::core::Position aircraft_position{};
  sarzone::core::Position landing_position{};
  double glide_distance_nm{};
  double glide_time_min{};
  double drift_distance_nm{};
  double uncertainty_radius_nm{};
  sarzone::core::Status status{sarzone::core::Status::Ok};
};

/**
 * @brief Predicts where an unpowered glide along the current heading ends.
 *
 * Glide time always uses the rated emergency descent rate; the wind drift over that time
 * is applied after the glide. Uncertainty is 10% of the glide range plus 20% of the drift.
 */
class LandingZonePredictor final {
 public:
  [[nodiscard]] LandingZoneResult evaluate(const sarzone::core::FlightState& flight,
                                           const sarzone::core::WindConditions& wind,
                                           const sarzone::core::AircraftProfile& aircraft) const;
};

/**
 * @brief Closed uncertainty ring around the predicted landing position.
 * @return `segments + 1` points, empty when the prediction failed.
 */
[[nodiscard]] std::vector<sarzone::core::Position> landing_zone_ring(const LandingZoneResult& zone, int segments = 36);

}  // namespace sarzone::search
