/**
 * @file render_adapter.hpp
 * @brief Map-layer payload and the consumer interface that draws it.
 * @author Watosn
 */
#pragma once

#include <vector>

#include "sarzone/core/types.hpp"

namespace sarzone::io {

/**
 * @brief One weighted heat point.
 */
struct RenderPoint {
  double lat_deg{};
  double lon_deg{};
  double weight{};
};

/**
 * @brief Everything a map layer needs to draw one search result.
 */
struct RenderPayload {
  double center_lat_deg{};
  double center_lon_deg{};
  double radius_m{};
  std::vector<RenderPoint> points{};
};

/**
 * @brief Consumer of render payloads (map widget, tile overlay, ...).
 *
 * Weight scaling for visualization is up to the implementation.
 */
class IRenderAdapter {
 public:
  virtual ~IRenderAdapter() = default;
  virtual void render(const RenderPayload& payload) = 0;
};

/**
 * @brief Build the payload; the radius is converted to meters.
 */
[[nodiscard]] RenderPayload make_render_payload(const sarzone::core::SearchArea& area,
                                                const sarzone::core::ProbabilityField& field);

}  // namespace sarzone::io
