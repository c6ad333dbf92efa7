/**
 * @file constants.hpp
 * @brief Shared physical and algorithm constants.
 * @author Watosn
 */
#pragma once

namespace geoproxyvis::core::constants {

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPi;
inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kMinutesPerDay = 1440.0;
inline constexpr double kUnixEpochJd = 2440587.5;
inline constexpr double kJ2000Jd = 2451545.0;
inline constexpr double kDaysPerJulianCentury = 36525.0;
inline constexpr double kEarthRadiusWgs84M = 6378137.0;

// Day/night split; the VIS adjustment divides by cos(SZA) so 90 deg is excluded.
inline constexpr double kSzaNightThresholdDeg = 89.0;

// Visible reflectance spans 0..1.3; ProxyVis spans 0..1 and is scaled to match.
inline constexpr double kVisValidMin = 0.0;
inline constexpr double kVisValidMax = 1.3;
inline constexpr double kVisScalingFactor = 1.3;

}  // namespace geoproxyvis::core::constants
