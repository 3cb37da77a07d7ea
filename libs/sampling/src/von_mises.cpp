/**
 * @file von_mises.cpp
 * @brief Von Mises angular sampling implementation.
 * @author Watosn
 */

#include "sarzone/sampling/von_mises.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "sarzone/core/math_utils.hpp"

namespace sarzone::sampling {

VonMisesDraw sample_von_mises(double mu_rad, double kappa, sarzone::core::IUniformSource& source, int max_attempts) {
  using sarzone::core::Status;
  constexpr double pi = std::numbers::pi;

  if (!std::isfinite(mu_rad) || !std::isfinite(kappa) || kappa < 0.0 || max_attempts < 1) {
    return VonMisesDraw{.status = Status::InvalidInput};
  }

  if (kappa == 0.0) {
    // u in [0, 1) maps onto (-pi, pi].
    const double u = source.next();
    return VonMisesDraw{.angle_rad = pi - 2.0 * pi * u, .attempts = 1, .status = Status::Ok};
  }

  const double a = 1.0 + std::sqrt(1.0 + 4.0 * kappa * kappa);
  const double b = (a - std::sqrt(2.0 * a)) / (2.0 * kappa);
  const double r = (1.0 + b * b) / (2.0 * b);

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    const double u1 = source.next();
    const double z = std::cos(pi * u1);
    const double f = (1.0 + r * z) / (r + z);
    const double c = kappa * (r - f);

    const double u2 = source.next();
    if (u2 <= c * (2.0 - c) || u2 <= c * std::exp(1.0 - c)) {
      const double u3 = source.next();
      const double sign = (u3 > 0.5) ? 1.0 : ((u3 < 0.5) ? -1.0 : 0.0);
      const double theta = mu_rad + sign * std::acos(std::clamp(f, -1.0, 1.0));
      return VonMisesDraw{.angle_rad = sarzone::core::wrap_pi(theta), .attempts = attempt, .status = Status::Ok};
    }
  }
  return VonMisesDraw{.attempts = max_attempts, .status = Status::SamplingTimeout};
}

}  // namespace sarzone::sampling
