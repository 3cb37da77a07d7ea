/**
 * @file result_exporter.cpp
 * @brief CSV and GeoJSON serialization implementation.
 * @author Watosn
 */

#include "sarzone/io/result_exporter.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>

#include <fmt/format.h>

#include "sarzone/geodesy/geodesy.hpp"

namespace sarzone::io {
namespace {

std::string lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

void append_point_feature(fmt::memory_buffer& buf,
                          const sarzone::core::Position& p,
                          const char* type,
                          double probability,
                          const std::string& description) {
  auto out = std::back_inserter(buf);
  fmt::format_to(out, "    {{\n");
  fmt::format_to(out, "      \"type\": \"Feature\",\n");
  fmt::format_to(out, "      \"geometry\": {{\"type\": \"Point\", \"coordinates\": [{}, {}]}},\n", p.lon_deg, p.lat_deg);
  fmt::format_to(out, "      \"properties\": {{\"type\": \"{}\", \"probability\": {}, \"description\": \"{}\"}}\n", type,
                 probability, description);
  fmt::format_to(out, "    }}");
}

}  // namespace

std::optional<ExportFormat> parse_export_format(std::string_view text) {
  const auto key = lowercase(text);
  if (key == "csv") {
    return ExportFormat::Csv;
  }
  if (key == "geojson") {
    return ExportFormat::GeoJson;
  }
  return std::nullopt;
}

std::string escape_json(std::string_view text) {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);
  for (const char ch : text) {
    switch (ch) {
      case '"':
        fmt::format_to(out, "\\\"");
        break;
      case '\\':
        fmt::format_to(out, "\\\\");
        break;
      case '\n':
        fmt::format_to(out, "\\n");
        break;
      case '\r':
        fmt::format_to(out, "\\r");
        break;
      case '\t':
        fmt::format_to(out, "\\t");
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20U) {
          fmt::format_to(out, "\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(ch)));
        } else {
          buf.push_back(ch);
        }
        break;
    }
  }
  return fmt::to_string(buf);
}

const char* file_extension(ExportFormat format) {
  switch (format) {
    case ExportFormat::Csv:
      return "csv";
    case ExportFormat::GeoJson:
      return "geojson";
    default:
      return "dat";
  }
}

std::string export_csv(const sarzone::core::SearchArea& area, const sarzone::core::ProbabilityField& field) {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);
  fmt::format_to(out, "Latitude,Longitude,Probability,Type\n");
  fmt::format_to(out, "{},{},1.0,center\n", area.center.lat_deg, area.center.lon_deg);

  const auto boundary = sarzone::geodesy::circle_ring(area.center, area.radius_nm, kBoundarySegments, false);
  for (const auto& p : boundary) {
    fmt::format_to(out, "{},{},0.0,boundary\n", p.lat_deg, p.lon_deg);
  }

  for (const auto& point : field) {
    if (point.probability > kCsvProbabilityThreshold) {
      fmt::format_to(out, "{},{},{},probability\n", point.position.lat_deg, point.position.lon_deg, point.probability);
    }
  }
  return fmt::to_string(buf);
}

std::string export_geojson(const sarzone::core::SearchArea& area, const sarzone::core::ProbabilityField& field) {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);
  fmt::format_to(out, "{{\n  \"type\": \"FeatureCollection\",\n  \"features\": [\n");

  append_point_feature(buf, area.center, "center", 1.0, "Search Area Center");

  const auto ring = sarzone::geodesy::circle_ring(area.center, area.radius_nm, kBoundarySegments, true);
  fmt::format_to(out, ",\n    {{\n");
  fmt::format_to(out, "      \"type\": \"Feature\",\n");
  fmt::format_to(out, "      \"geometry\": {{\"type\": \"Polygon\", \"coordinates\": [[");
  for (std::size_t i = 0; i < ring.size(); ++i) {
    fmt::format_to(out, "{}[{}, {}]", (i == 0U) ? "" : ", ", ring[i].lon_deg, ring[i].lat_deg);
  }
  fmt::format_to(out, "]]}},\n");
  fmt::format_to(out,
                 "      \"properties\": {{\"type\": \"boundary\", \"description\": \"Search Area Boundary ({:.2f} nm radius)\"}}\n",
                 area.radius_nm);
  fmt::format_to(out, "    }}");

  for (const auto& point : field) {
    if (point.probability > kGeoJsonProbabilityThreshold) {
      fmt::format_to(out, ",\n");
      append_point_feature(buf, point.position, "probability", point.probability,
                           fmt::format("Probability: {:.2f}", point.probability));
    }
  }

  fmt::format_to(out, "\n  ]\n}}\n");
  return fmt::to_string(buf);
}

std::string export_result(ExportFormat format,
                          const sarzone::core::SearchArea& area,
                          const sarzone::core::ProbabilityField& field) {
  return (format == ExportFormat::GeoJson) ? export_geojson(area, field) : export_csv(area, field);
}

std::string export_file_name(ExportFormat format, const std::tm& local_time) {
  return fmt::format("aircraft_search_{:04}{:02}{:02}_{:02}{:02}{:02}.{}", local_time.tm_year + 1900, local_time.tm_mon + 1,
                     local_time.tm_mday, local_time.tm_hour, local_time.tm_min, local_time.tm_sec, file_extension(format));
}

std::string export_file_name(ExportFormat format, std::time_t when) {
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &when);
#else
  localtime_r(&when, &local);
#endif
  return export_file_name(format, local);
}

}  // namespace sarzone::io
