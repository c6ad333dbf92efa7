/**
 * @file transforms.hpp
 * @brief Shared time helpers.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "geoproxyvis/core/constants.hpp"
#include "geoproxyvis/core/types.hpp"

namespace geoproxyvis::core {

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
inline int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

/**
 * @brief Build a UTC epoch from calendar fields.
 */
inline Epoch epoch_from_utc(int year, unsigned month, unsigned day, int hour = 0, int minute = 0, double second = 0.0) {
  const double days = static_cast<double>(days_from_civil(year, month, day));
  return Epoch{.utc_seconds = days * constants::kSecondsPerDay + hour * 3600.0 + minute * 60.0 + second};
}

/**
 * @brief Days in a proleptic Gregorian month, 0 for an invalid month.
 */
inline unsigned days_in_month(int year, unsigned month) {
  constexpr unsigned kDays[12] = {31U, 28U, 31U, 30U, 31U, 30U, 31U, 31U, 30U, 31U, 30U, 31U};
  if (month < 1U || month > 12U) {
    return 0U;
  }
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  return (month == 2U && leap) ? 29U : kDays[month - 1U];
}

/**
 * @brief Read a fixed-width run of decimal digits; false on any other character.
 */
inline bool parse_digits(const std::string& text, std::size_t pos, std::size_t width, int& value) {
  if (pos + width > text.size()) {
    return false;
  }
  value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
    value = value * 10 + (text[i] - '0');
  }
  return true;
}

/**
 * @brief Parse `YYYY-MM-DDTHH:MM[:SS[.fff]][Z]` (a space may replace `T`).
 *
 * The whole string must match; impossible calendar dates are rejected.
 */
inline std::optional<Epoch> parse_utc_timestamp(const std::string& text) {
  if (text.size() < 16 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') || text[13] != ':') {
    return std::nullopt;
  }
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 5, 2, month) || !parse_digits(text, 8, 2, day) ||
      !parse_digits(text, 11, 2, hour) || !parse_digits(text, 14, 2, minute)) {
    return std::nullopt;
  }

  std::string tail = text.substr(16);
  if (!tail.empty() && (tail.back() == 'Z' || tail.back() == 'z')) {
    tail.pop_back();
  }
  double second = 0.0;
  if (!tail.empty()) {
    // ":SS" with an optional fraction.
    if (tail.size() < 3 || tail[0] != ':' || tail[1] < '0' || tail[1] > '9' || tail[2] < '0' || tail[2] > '9') {
      return std::nullopt;
    }
    const std::string sec = tail.substr(1);
    if (sec.find_first_not_of("0123456789.") != std::string::npos) {
      return std::nullopt;
    }
    try {
      std::size_t used = 0;
      second = std::stod(sec, &used);
      if (used != sec.size()) {
        return std::nullopt;
      }
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }

  const auto umonth = static_cast<unsigned>(month);
  const auto uday = static_cast<unsigned>(day);
  if (day < 1 || uday > days_in_month(year, umonth) || hour > 23 || minute > 59 || second >= 61.0) {
    return std::nullopt;
  }
  return epoch_from_utc(year, umonth, uday, hour, minute, second);
}

/**
 * @brief Convert UTC seconds since Unix epoch to JD UTC.
 */
inline double utc_seconds_to_julian_date_utc(double utc_seconds) {
  return utc_seconds / constants::kSecondsPerDay + constants::kUnixEpochJd;
}

/**
 * @brief Minutes elapsed since 00:00 UTC of the epoch's day.
 */
inline double utc_minutes_of_day(double utc_seconds) {
  double sod = std::fmod(utc_seconds, constants::kSecondsPerDay);
  if (sod < 0.0) {
    sod += constants::kSecondsPerDay;
  }
  return sod / 60.0;
}

/**
 * @brief Scan midpoint used as the representative time of a full-disk image.
 *
 * Geostationary file timestamps mark the scan start; a 10 minute full disk is
 * represented by start + 5 minutes.
 */
inline Epoch scan_midpoint(const Epoch& scan_start, int scan_minutes) {
  return Epoch{.utc_seconds = scan_start.utc_seconds + 0.5 * static_cast<double>(scan_minutes) * 60.0};
}

}  // namespace geoproxyvis::core
