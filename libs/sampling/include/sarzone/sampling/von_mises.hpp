/**
 * @file von_mises.hpp
 * @brief Von Mises angular sampling by Best-Fisher rejection.
 * @author Watosn
 */
#pragma once

#include "sarzone/core/interfaces.hpp"
#include "sarzone/core/types.hpp"

namespace sarzone::sampling {

/**
 * @brief One von Mises draw.
 */
struct VonMisesDraw {
  double angle_rad{};
  int attempts{};
  sarzone::core::Status status{sarzone::core::Status::Ok};
};

/**
 * @brief Draw an angle from a von Mises distribution.
 *
 * `kappa == 0` degenerates to a uniform angle on (-pi, pi]. Otherwise the Best-Fisher
 * envelope is used and the loop is bounded by `max_attempts`; exceeding it returns
 * `SamplingTimeout`.
 * @param mu_rad Mean direction.
 * @param kappa Concentration, >= 0.
 * @param source Uniform draws.
 * @param max_attempts Rejection loop bound, >= 1.
 * @return Angle wrapped to (-pi, pi].
 */
[[nodiscard]] VonMisesDraw sample_von_mises(double mu_rad,
                                            double kappa,
                                            sarzone::core::IUniformSource& source,
                                            int max_attempts);

}  // namespace sarzone::sampling
