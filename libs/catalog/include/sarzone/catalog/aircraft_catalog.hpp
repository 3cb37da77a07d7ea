/**
 * @file aircraft_catalog.hpp
 * @brief Aircraft profile lookup table.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sarzone/core/types.hpp"

namespace sarzone::catalog {

/**
 * @brief Aircraft profile lookup by type key or display name.
 */
class AircraftCatalog final {
 public:
  /**
   * @brief One catalog row.
   */
  struct Entry {
    std::string key{};
    sarzone::core::AircraftProfile profile{};
  };

  /**
   * @brief CSV catalog configuration.
   *
   * Rows: `key,name,glide_ratio,max_range_nm,cruise_speed_kt,fuel_endurance_h,emergency_descent_rate_fpm`.
   */
  struct Config {
    std::filesystem::path csv_file{};
  };

  /**
   * @brief Key of the fallback profile used by `get_or_default`.
   */
  static constexpr std::string_view kDefaultKey = "C172";

  /**
   * @brief Catalog of the built-in general aviation, business and airline types.
   */
  static AircraftCatalog builtin();

  /**
   * @brief Factory helper that parses a CSV catalog.
   *
   * Malformed rows and rows with non-positive glide ratio or descent rate are skipped. An
   * unreadable file yields an empty catalog.
   */
  static std::unique_ptr<AircraftCatalog> Create(const Config& config);

  explicit AircraftCatalog(std::vector<Entry> entries) : entries_(std::move(entries)) {}

  /**
   * @brief Look up by key (case-insensitive) or exact display name.
   */
  [[nodiscard]] std::optional<sarzone::core::AircraftProfile> find(std::string_view key_or_name) const;

  /**
   * @brief Look up, falling back to the built-in default type.
   */
  [[nodiscard]] sarzone::core::AircraftProfile get_or_default(std::string_view key_or_name) const;

  [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

 private:
  std::vector<Entry> entries_{};
};

}  // namespace sarzone::catalog
