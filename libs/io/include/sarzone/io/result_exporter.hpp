/**
 * @file result_exporter.hpp
 * @brief CSV and GeoJSON serialization of a search result.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include "sarzone/core/types.hpp"

namespace sarzone::io {

/**
 * @brief Supported export encodings.
 */
enum class ExportFormat : std::uint8_t { Csv, GeoJson };

inline constexpr int kBoundarySegments = 36;
inline constexpr double kCsvProbabilityThreshold = 0.2;
inline constexpr double kGeoJsonProbabilityThreshold = 0.5;

/**
 * @brief Parse `csv` or `geojson` (case-insensitive).
 */
[[nodiscard]] std::optional<ExportFormat> parse_export_format(std::string_view text);

/**
 * @brief Escape text for use inside a JSON string literal (quotes not included).
 */
[[nodiscard]] std::string escape_json(std::string_view text);

/**
 * @brief File extension without the dot.
 */
[[nodiscard]] const char* file_extension(ExportFormat format);

/**
 * @brief CSV with one center row, 36 boundary rows and the points above 0.2.
 */
[[nodiscard]] std::string export_csv(const sarzone::core::SearchArea& area, const sarzone::core::ProbabilityField& field);

/**
 * @brief GeoJSON FeatureCollection with the center, the closed boundary polygon and the
 * points above 0.5. Coordinates are `[lon, lat]`.
 */
[[nodiscard]] std::string export_geojson(const sarzone::core::SearchArea& area,
                                         const sarzone::core::ProbabilityField& field);

[[nodiscard]] std::string export_result(ExportFormat format,
                                        const sarzone::core::SearchArea& area,
                                        const sarzone::core::ProbabilityField& field);

/**
 * @brief `aircraft_search_<YYYYMMDD>_<HHMMSS>.<ext>` for a broken-down local time.
 */
[[nodiscard]] std::string export_file_name(ExportFormat format, const std::tm& local_time);

/**
 * @brief Export file name for a calendar time, converted to local time.
 */
[[nodiscard]] std::string export_file_name(ExportFormat format, std::time_t when);

}  // namespace sarzone::io
