/**
 * @file probability_field.hpp
 * @brief Monte-Carlo probability field over a search area.
 * @author Watosn
 */
#pragma once

#include <cstddef>

#include "sarzone/core/interfaces.hpp"
#include "sarzone/core/types.hpp"

namespace sarzone::sampling {

/**
 * @brief Inputs for one probability field evaluation.
 *
 * `glide_distance_nm` is carried for interface compatibility and is not consumed by the
 * sampling algorithm.
 */
struct ProbabilityFieldRequest {
  sarzone::core::SearchArea area{};
  std::size_t sample_count{};
  double heading_deg{};
  double wind_direction_deg{};
  double wind_speed_kt{};
  double glide_distance_nm{};
};

/**
 * @brief Probability field output bundle.
 */
struct ProbabilityFieldResult {
  sarzone::core::ProbabilityField field{};
  double bias_direction_rad{};
  sarzone::core::Status status{sarzone::core::Status::Ok};
};

/**
 * @brief Direction of highest probability from heading and wind.
 *
 * Weighted sum of the unit vectors of heading and wind direction, with the wind weight
 * `min(wind_speed_kt / 50, 0.8)`. Angles are taken as given (cos/sin of the compass
 * value in radians).
 * @return `atan2(dy, dx)` in (-pi, pi].
 */
[[nodiscard]] double bias_direction_rad(double heading_deg, double wind_direction_deg, double wind_speed_kt);

/**
 * @brief Populates a search area with weighted points.
 *
 * Each point draws a Rayleigh-style distance clipped to the radius and a von Mises angle
 * around the bias direction, then is weighted by distance decay and alignment with the
 * bias. Weights are normalized so the largest is exactly 1.
 */
class ProbabilityFieldSampler final {
 public:
  /**
   * @brief Sampler tuning.
   */
  struct Config {
    double kappa{2.0};
    int max_rejection_attempts{10000};
  };

  ProbabilityFieldSampler() = default;
  explicit ProbabilityFieldSampler(Config config) : config_(config) {}

  /**
   * @brief Sample the field.
   * @param request Area and directional inputs.
   * @param source Uniform draws; identical sequences give identical fields.
   * @return Result with `status` set. On failure the field is empty.
   */
  [[nodiscard]] ProbabilityFieldResult evaluate(const ProbabilityFieldRequest& request,
                                                sarzone::core::IUniformSource& source) const;

  [[nodiscard]] const Config& config() const noexcept { return config_; }

 private:
  Config config_{};
};

}  // namespace sarzone::sampling
