/**
 * @file uniform_source.cpp
 * @brief Seeded uniform random source implementation.
 * @author Watosn
 */

#include "sarzone/sampling/uniform_source.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace sarzone::sampling {

SeededUniformSource SeededUniformSource::from_entropy() {
  std::random_device rd;
  const std::uint64_t hi = static_cast<std::uint64_t>(rd());
  const std::uint64_t lo = static_cast<std::uint64_t>(rd());
  return SeededUniformSource((hi << 32U) ^ lo);
}

double SeededUniformSource::next() {
  constexpr double kTwoPowMinus53 = 1.0 / 9007199254740992.0;
  return static_cast<double>(engine_() >> 11U) * kTwoPowMinus53;
}

std::optional<std::uint64_t> parse_seed(std::string_view text) {
  const std::string s(text);
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (*end != '\0' || errno == ERANGE) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(v);
}

}  // namespace sarzone::sampling
