/**
 * @file types.hpp
 * @brief Core domain types for geoproxyvis.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>

#include <Eigen/Dense>

namespace geoproxyvis::core {

/**
 * @brief Standard status code used by model and pipeline outputs.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  UnsupportedSatellite,
  UnknownAlgorithm,
  MissingChannel,
  ShapeMismatch,
  DataUnavailable,
  NumericalError
};

/**
 * @brief Two-dimensional image of physical values; NaN marks invalid pixels.
 */
using Raster = Eigen::ArrayXXd;

/**
 * @brief Per-pixel boolean mask matching a `Raster`.
 */
using MaskRaster = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

/**
 * @brief Physical field type of a channel raster.
 */
enum class FieldType : std::uint8_t { BtTemp, Radiances };

/**
 * @brief Output grid selection for day/night composites.
 */
enum class OutputResolution : std::uint8_t { Km2, Km05, Both };

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 */
struct Epoch {
  double utc_seconds{};
};

/**
 * @brief One geostationary scan: timing plus IR and VIS navigation grids.
 *
 * The scan start is the file timestamp; the scan midpoint is derived from
 * `scan_minutes`.
 */
struct SatelliteScan {
  std::string satellite{};
  Epoch scan_start{};
  int scan_minutes{10};
  Raster lons_2km{};
  Raster lats_2km{};
  Raster lons_05km{};
  Raster lats_05km{};
};

/**
 * @brief Render a status code for logs and CLI output.
 */
inline const char* status_to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::UnsupportedSatellite:
      return "unsupported_satellite";
    case Status::UnknownAlgorithm:
      return "unknown_algorithm";
    case Status::MissingChannel:
      return "missing_channel";
    case Status::ShapeMismatch:
      return "shape_mismatch";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::NumericalError:
      return "numerical_error";
    default:
      return "unknown";
  }
}

inline const char* field_type_to_string(FieldType t) { return t == FieldType::BtTemp ? "bt_temp" : "radiances"; }

inline bool same_shape(const Raster& a, const Raster& b) { return a.rows() == b.rows() && a.cols() == b.cols(); }

}  // namespace geoproxyvis::core
