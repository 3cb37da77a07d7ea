/**
 * @file uniform_source.hpp
 * @brief Seeded uniform random source.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string_view>

#include "sarzone/core/interfaces.hpp"

namespace sarzone::sampling {

/**
 * @brief Uniform source backed by a 64-bit Mersenne Twister.
 *
 * The top 53 bits of each engine output are scaled to [0, 1), so a given seed yields the
 * same sequence with every standard library.
 */
class SeededUniformSource final : public sarzone::core::IUniformSource {
 public:
  explicit SeededUniformSource(std::uint64_t seed) : seed_(seed), engine_(seed) {}

  /**
   * @brief Construct a source seeded from `std::random_device`.
   */
  static SeededUniformSource from_entropy();

  [[nodiscard]] double next() override;

  [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

 private:
  std::uint64_t seed_{};
  std::mt19937_64 engine_;
};

/**
 * @brief Parse a base-10 unsigned seed.
 * @return Empty for empty, signed, non-numeric, partially numeric or out-of-range text.
 */
[[nodiscard]] std::optional<std::uint64_t> parse_seed(std::string_view text);

}  // namespace sarzone::sampling
