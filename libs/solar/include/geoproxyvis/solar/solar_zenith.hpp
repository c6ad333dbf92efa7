/**
 * @file solar_zenith.hpp
 * @brief Solar position, per-pixel solar zenith angle and day/night masks.
 * @author Watosn
 */
#pragma once

#include "geoproxyvis/core/constants.hpp"
#include "geoproxyvis/core/types.hpp"

namespace geoproxyvis::solar {

/**
 * @brief Surface conditions assumed by the refraction correction.
 */
inline constexpr double kStandardPressureMbar = 1013.25;
inline constexpr double kStandardTemperatureC = 15.0;

/**
 * @brief Elevation below which the solar disk is fully set and no refraction applies.
 */
inline constexpr double kRefractionCutoffElevationDeg = -(0.26667 + 0.5667);

/**
 * @brief Apparent solar coordinates at one epoch.
 */
struct SolarPosition {
  double declination_rad{};
  double equation_of_time_min{};
  double subsolar_lat_deg{};
  double subsolar_lon_deg{};
};

/**
 * @brief Solar zenith angle raster with status.
 */
struct SzaResult {
  core::Raster sza_deg{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Day and night pixel masks derived from SZA.
 *
 * Pixels with NaN SZA belong to neither mask.
 */
struct DayNightMask {
  core::MaskRaster day{};
  core::MaskRaster night{};
};

/**
 * @brief Low-precision solar coordinates (NOAA/Meeus), good to ~0.01 deg for 1950-2050.
 */
[[nodiscard]] SolarPosition solar_position(const core::Epoch& epoch);

/**
 * @brief Atmospheric refraction (NREL SPA, Bennett form) added to a geometric elevation.
 * @param elevation_deg Geometric solar elevation.
 * @return Correction in degrees; 0 below `kRefractionCutoffElevationDeg` or for NaN.
 */
[[nodiscard]] double refraction_correction_deg(double elevation_deg, double pressure_mbar = kStandardPressureMbar,
                                               double temperature_c = kStandardTemperatureC);

/**
 * @brief Apparent (refracted) solar zenith angle in degrees at one location.
 */
[[nodiscard]] double solar_zenith_deg(const core::Epoch& epoch, double lat_deg, double lon_deg);

/**
 * @brief Solar zenith angle for every pixel of a lon/lat grid.
 * @param epoch Representative time of the grid (scan midpoint for full disks).
 * @param lons_deg Longitudes, degrees east.
 * @param lats_deg Latitudes, degrees north; must match `lons_deg` in shape.
 * @return Apparent SZA in degrees, NaN where lon/lat are not finite.
 */
[[nodiscard]] SzaResult solar_zenith_angle(const core::Epoch& epoch, const core::Raster& lons_deg,
                                           const core::Raster& lats_deg);

/**
 * @brief Split pixels into day (SZA <= threshold) and night (SZA > threshold).
 */
[[nodiscard]] DayNightMask classify_day_night(const core::Raster& sza_deg,
                                              double threshold_deg = core::constants::kSzaNightThresholdDeg);

}  // namespace geoproxyvis::solar
