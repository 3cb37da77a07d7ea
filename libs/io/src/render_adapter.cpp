/**
 * @file render_adapter.cpp
 * @brief Render payload construction.
 * @author Watosn
 */

#include "sarzone/io/render_adapter.hpp"

#include "sarzone/core/constants.hpp"

namespace sarzone::io {

RenderPayload make_render_payload(const sarzone::core::SearchArea& area, const sarzone::core::ProbabilityField& field) {
  RenderPayload payload{.center_lat_deg = area.center.lat_deg,
                        .center_lon_deg = area.center.lon_deg,
                        .radius_m = area.radius_nm * sarzone::core::constants::kMetersPerNauticalMile};
  payload.points.reserve(field.size());
  for (const auto& p : field) {
    payload.points.push_back(RenderPoint{.lat_deg = p.position.lat_deg, .lon_deg = p.position.lon_deg, .weight = p.probability});
  }
  return payload;
}

}  // namespace sarzone::io
