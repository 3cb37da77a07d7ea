/**
 * @file interfaces.hpp
 * @brief Core capability interfaces.
 * @author Watosn
 */
#pragma once

namespace sarzone::core {

/**
 * @brief Source of uniform random draws.
 *
 * Injected per call so that sampling is reproducible under a fixed seed.
 */
class IUniformSource {
 public:
  virtual ~IUniformSource() = default;
  /**
   * @brief Draw the next uniform value.
   * @return Value in [0, 1).
   */
  [[nodiscard]] virtual double next() = 0;
};

}  // namespace sarzone::core
