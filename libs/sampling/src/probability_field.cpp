/**
 * @file probability_field.cpp
 * @brief Monte-Carlo probability field implementation.
 * @author Watosn
 */

#include "sarzone/sampling/probability_field.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <Eigen/Dense>

#include "sarzone/core/constants.hpp"
#include "sarzone/core/math_utils.hpp"
#include "sarzone/geodesy/geodesy.hpp"
#include "sarzone/sampling/von_mises.hpp"

namespace sarzone::sampling {
namespace {

constexpr double kWindWeightPerKnot = 1.0 / 50.0;
constexpr double kMaxWindWeight = 0.8;
constexpr double kDistanceDecay = 1.5;
constexpr double kAngleFloor = 0.7;
constexpr double kAngleGain = 0.3;

Eigen::Vector2d unit(double rad) { return Eigen::Vector2d(std::cos(rad), std::sin(rad)); }

}  // namespace

double bias_direction_rad(double heading_deg, double wind_direction_deg, double wind_speed_kt) {
  const double wind_weight = std::min(wind_speed_kt * kWindWeightPerKnot, kMaxWindWeight);
  const double heading_weight = 1.0 - wind_weight;
  const Eigen::Vector2d d = heading_weight * unit(sarzone::core::deg_to_rad(heading_deg)) +
                            wind_weight * unit(sarzone::core::deg_to_rad(wind_direction_deg));
  return std::atan2(d.y(), d.x());
}

ProbabilityFieldResult ProbabilityFieldSampler::evaluate(const ProbabilityFieldRequest& request,
                                                         sarzone::core::IUniformSource& source) const {
  using sarzone::core::Status;
  using sarzone::core::constants::kEarthRadiusNm;

  if (request.sample_count < 1U || !std::isfinite(request.heading_deg) || !std::isfinite(request.wind_direction_deg) ||
      !std::isfinite(request.wind_speed_kt) || request.wind_speed_kt < 0.0) {
    return ProbabilityFieldResult{.status = Status::InvalidInput};
  }
  const double radius = request.area.radius_nm;
  if (!std::isfinite(radius) || radius <= 0.0) {
    return ProbabilityFieldResult{.status = Status::DegenerateGeometry};
  }

  const double bias = bias_direction_rad(request.heading_deg, request.wind_direction_deg, request.wind_speed_kt);
  const auto& center = request.area.center;
  const double lon_scale_nm = kEarthRadiusNm * std::cos(sarzone::core::deg_to_rad(center.lat_deg));

  sarzone::core::ProbabilityField field;
  field.reserve(request.sample_count);
  double max_probability = 0.0;

  for (std::size_t i = 0; i < request.sample_count; ++i) {
    const double u = 1.0 - source.next();  // (0, 1]
    const double dist = std::min(radius * std::sqrt(-2.0 * std::log(u)), radius);

    const auto draw = sample_von_mises(bias, config_.kappa, source, config_.max_rejection_attempts);
    if (draw.status != Status::Ok) {
      return ProbabilityFieldResult{.bias_direction_rad = bias, .status = draw.status};
    }
    const double angle = draw.angle_rad;
    const Eigen::Vector2d offset = dist * unit(angle);

    const double angle_diff = sarzone::core::angular_separation(angle, bias);
    const double distance_factor = std::exp(-kDistanceDecay * dist / radius);
    const double angle_factor = std::cos(angle_diff) * std::cos(angle_diff);
    const double probability = distance_factor * (kAngleFloor + kAngleGain * angle_factor);

    const sarzone::core::Position p{
        .lat_deg = center.lat_deg + sarzone::core::rad_to_deg(offset.y() / kEarthRadiusNm),
        .lon_deg = sarzone::geodesy::wrap_longitude_deg(center.lon_deg + sarzone::core::rad_to_deg(offset.x() / lon_scale_nm))};
    field.push_back(sarzone::core::ProbabilityPoint{.position = p, .probability = probability});
    max_probability = std::max(max_probability, probability);
  }

  for (auto& point : field) {
    point.probability /= max_probability;
  }
  return ProbabilityFieldResult{.field = std::move(field), .bias_direction_rad = bias, .status = Status::Ok};
}

}  // namespace sarzone::sampling
