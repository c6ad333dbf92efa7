/**
 * @file satellite.hpp
 * @brief Supported geostationary platforms and their imager families.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace geoproxyvis::core {

/**
 * @brief Geostationary platforms with ProxyVis coefficients and saved ranges.
 */
enum class Satellite : std::uint8_t { Goes16, Goes17, Goes18, Himawari8, Himawari9, Meteosat9, Meteosat10, Meteosat11 };

/**
 * @brief Imager family, which determines channel naming.
 */
enum class SensorFamily : std::uint8_t { Abi, Ahi, Seviri };

inline constexpr std::array<std::pair<std::string_view, Satellite>, 8> kSatelliteNames{{
    {"goes16", Satellite::Goes16},
    {"goes17", Satellite::Goes17},
    {"goes18", Satellite::Goes18},
    {"himawari8", Satellite::Himawari8},
    {"himawari9", Satellite::Himawari9},
    {"meteosat-9", Satellite::Meteosat9},
    {"meteosat-10", Satellite::Meteosat10},
    {"meteosat-11", Satellite::Meteosat11},
}};

/**
 * @brief Lower-case and trim surrounding whitespace.
 */
inline std::string sanitize_keyword(std::string_view text) {
  std::size_t first = 0;
  std::size_t last = text.size();
  while (first < last && std::isspace(static_cast<unsigned char>(text[first])) != 0) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])) != 0) {
    --last;
  }
  std::string out(text.substr(first, last - first));
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

/**
 * @brief Parse a satellite identifier such as `goes16` or ` Meteosat-11 `.
 * @return Empty optional when the platform is not supported.
 */
inline std::optional<Satellite> parse_satellite(std::string_view name) {
  const std::string key = sanitize_keyword(name);
  for (const auto& [text, sat] : kSatelliteNames) {
    if (key == text) {
      return sat;
    }
  }
  return std::nullopt;
}

inline std::string_view satellite_name(Satellite sat) {
  for (const auto& [text, s] : kSatelliteNames) {
    if (s == sat) {
      return text;
    }
  }
  return "unknown";
}

inline SensorFamily sensor_family(Satellite sat) {
  switch (sat) {
    case Satellite::Goes16:
    case Satellite::Goes17:
    case Satellite::Goes18:
      return SensorFamily::Abi;
    case Satellite::Himawari8:
    case Satellite::Himawari9:
      return SensorFamily::Ahi;
    default:
      return SensorFamily::Seviri;
  }
}

}  // namespace geoproxyvis::core
