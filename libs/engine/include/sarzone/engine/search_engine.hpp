/**
 * @file search_engine.hpp
 * @brief End-to-end search request evaluation.
 * @author Watosn
 */
#pragma once

#include <cstddef>

#include "sarzone/core/interfaces.hpp"
#include "sarzone/core/types.hpp"
#include "sarzone/sampling/probability_field.hpp"
#include "sarzone/search/search_area.hpp"

namespace sarzone::engine {

/**
 * @brief One calculation request.
 */
struct SearchRequest {
  sarzone::core::FlightState flight{};
  sarzone::core::WindConditions wind{};
  sarzone::core::AircraftProfile aircraft{};
  double radius_multiplier{1.0};
  std::size_t sample_count{1000};
};

/**
 * @brief Result-or-error of one request.
 *
 * When `status != Ok`, `area` and `field` are default/empty and must not be rendered.
 */
struct SearchResult {
  sarzone::core::SearchArea area{};
  sarzone::core::ProbabilityField field{};
  sarzone::search::SearchAreaResult estimate{};
  double bias_direction_rad{};
  sarzone::core::Status status{sarzone::core::Status::Ok};
};

/**
 * @brief Validate every field of a request before any geometry is computed.
 */
[[nodiscard]] sarzone::core::Status validate_request(const SearchRequest& request);

/**
 * @brief Runs estimation and sampling for a request.
 */
class SearchEngine final {
 public:
  /**
   * @brief Engine configuration.
   */
  struct Config {
    sarzone::sampling::ProbabilityFieldSampler::Config sampler{};
  };

  SearchEngine() = default;
  explicit SearchEngine(Config config) : sampler_(config.sampler) {}

  /**
   * @brief Evaluate one request.
   * @param request Validated up front; invalid requests return `InvalidInput`.
   * @param source Uniform draws for the sampler.
   * @return `DegenerateGeometry` for a non-positive radius, `SamplingTimeout` when the
   * angular sampler exhausts its retries, `Ok` otherwise.
   */
  [[nodiscard]] SearchResult evaluate(const SearchRequest& request, sarzone::core::IUniformSource& source) const;

 private:
  sarzone::search::SearchAreaEstimator estimator_{};
  sarzone::sampling::ProbabilityFieldSampler sampler_{};
};

}  // namespace sarzone::engine
