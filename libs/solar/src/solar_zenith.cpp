/**
 * @file solar_zenith.cpp
 * @brief Solar position and solar zenith angle implementation.
 * @author Watosn
 */

#include "geoproxyvis/solar/solar_zenith.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "geoproxyvis/core/transforms.hpp"

namespace geoproxyvis::solar {
namespace {

using core::constants::kDegToRad;
using core::constants::kRadToDeg;

double wrap_deg_180(double deg) {
  double out = std::fmod(deg + 180.0, 360.0);
  if (out < 0.0) {
    out += 360.0;
  }
  return out - 180.0;
}

// SPA refraction term; callers mask elevations below the cutoff.
double bennett_refraction_deg(double elevation_deg, double pressure_mbar, double temperature_c) {
  const double scale = (pressure_mbar / 1010.0) * (283.0 / (273.0 + temperature_c));
  return scale * 1.02 / (60.0 * std::tan((elevation_deg + 10.3 / (elevation_deg + 5.11)) * kDegToRad));
}

}  // namespace

double refraction_correction_deg(double elevation_deg, double pressure_mbar, double temperature_c) {
  if (!(elevation_deg >= kRefractionCutoffElevationDeg)) {
    return 0.0;
  }
  return bennett_refraction_deg(elevation_deg, pressure_mbar, temperature_c);
}

SolarPosition solar_position(const core::Epoch& epoch) {
  const double jd = core::utc_seconds_to_julian_date_utc(epoch.utc_seconds);
  const double t = (jd - core::constants::kJ2000Jd) / core::constants::kDaysPerJulianCentury;

  const double l0_deg = std::fmod(280.46646 + t * (36000.76983 + t * 0.0003032), 360.0);
  const double m_deg = 357.52911 + t * (35999.05029 - 0.0001537 * t);
  const double e = 0.016708634 - t * (0.000042037 + 0.0000001267 * t);
  const double m = m_deg * kDegToRad;

  const double center_deg = std::sin(m) * (1.914602 - t * (0.004817 + 0.000014 * t)) +
                            std::sin(2.0 * m) * (0.019993 - 0.000101 * t) + std::sin(3.0 * m) * 0.000289;
  const double true_long_deg = l0_deg + center_deg;
  const double omega = (125.04 - 1934.136 * t) * kDegToRad;
  const double lambda = (true_long_deg - 0.00569 - 0.00478 * std::sin(omega)) * kDegToRad;

  const double eps0_deg = 23.0 + (26.0 + (21.448 - t * (46.815 + t * (0.00059 - t * 0.001813))) / 60.0) / 60.0;
  const double eps = (eps0_deg + 0.00256 * std::cos(omega)) * kDegToRad;

  const double declination = std::asin(std::sin(eps) * std::sin(lambda));

  const double y = std::pow(std::tan(0.5 * eps), 2);
  const double l0 = l0_deg * kDegToRad;
  const double eot_rad = y * std::sin(2.0 * l0) - 2.0 * e * std::sin(m) + 4.0 * e * y * std::sin(m) * std::cos(2.0 * l0) -
                         0.5 * y * y * std::sin(4.0 * l0) - 1.25 * e * e * std::sin(2.0 * m);
  const double eot_min = 4.0 * eot_rad * kRadToDeg;

  // Local apparent noon where UTC minutes + EoT + 4 * lon = 720.
  const double subsolar_lon = wrap_deg_180((720.0 - core::utc_minutes_of_day(epoch.utc_seconds) - eot_min) / 4.0);

  return SolarPosition{.declination_rad = declination,
                       .equation_of_time_min = eot_min,
                       .subsolar_lat_deg = declination * kRadToDeg,
                       .subsolar_lon_deg = subsolar_lon};
}

double solar_zenith_deg(const core::Epoch& epoch, double lat_deg, double lon_deg) {
  if (!std::isfinite(lat_deg) || !std::isfinite(lon_deg)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const auto pos = solar_position(epoch);
  const double lat = lat_deg * kDegToRad;
  const double ha = (lon_deg - pos.subsolar_lon_deg) * kDegToRad;
  const double cosz = std::sin(lat) * std::sin(pos.declination_rad) +
                      std::cos(lat) * std::cos(pos.declination_rad) * std::cos(ha);
  const double geometric = std::acos(std::clamp(cosz, -1.0, 1.0)) * kRadToDeg;
  return geometric - refraction_correction_deg(90.0 - geometric);
}

SzaResult solar_zenith_angle(const core::Epoch& epoch, const core::Raster& lons_deg, const core::Raster& lats_deg) {
  if (!core::same_shape(lons_deg, lats_deg)) {
    return SzaResult{.status = core::Status::ShapeMismatch};
  }
  const auto pos = solar_position(epoch);
  const double sin_dec = std::sin(pos.declination_rad);
  const double cos_dec = std::cos(pos.declination_rad);

  const core::Raster lat = lats_deg * kDegToRad;
  const core::Raster ha = (lons_deg - pos.subsolar_lon_deg) * kDegToRad;
  const core::Raster cosz = lat.sin() * sin_dec + lat.cos() * cos_dec * ha.cos();
  // NaN compares false on both sides and is carried through.
  const core::Raster upper = (cosz > 1.0).select(1.0, cosz);
  const core::Raster clamped = (upper < -1.0).select(-1.0, upper);
  const core::Raster geometric = clamped.acos() * kRadToDeg;

  const core::Raster elevation = 90.0 - geometric;
  const double scale = (kStandardPressureMbar / 1010.0) * (283.0 / (273.0 + kStandardTemperatureC));
  const core::Raster bent =
      scale * 1.02 / (60.0 * ((elevation + 10.3 / (elevation + 5.11)) * kDegToRad).tan());
  const core::Raster refraction = (elevation >= kRefractionCutoffElevationDeg).select(bent, 0.0);

  SzaResult out{};
  out.sza_deg = geometric - refraction;
  return out;
}

DayNightMask classify_day_night(const core::Raster& sza_deg, double threshold_deg) {
  DayNightMask mask{};
  mask.day = (sza_deg <= threshold_deg);
  mask.night = (sza_deg > threshold_deg);
  return mask;
}

}  // namespace geoproxyvis::solar
