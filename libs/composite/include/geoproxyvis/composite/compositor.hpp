/**
 * @file compositor.hpp
 * @brief Day/night GeoProxyVis composite pipeline.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "geoproxyvis/config/channel_arg_maps.hpp"
#include "geoproxyvis/core/channel_data.hpp"
#include "geoproxyvis/core/constants.hpp"
#include "geoproxyvis/core/types.hpp"
#include "geoproxyvis/norm/normalization.hpp"
#include "geoproxyvis/norm/saved_range_table.hpp"
#include "geoproxyvis/pvis/proxy_vis_model.hpp"
#include "geoproxyvis/regrid/resampler.hpp"
#include "geoproxyvis/vis/vis_model.hpp"

namespace geoproxyvis::composite {

/**
 * @brief One composite request. `scan` and `data` are borrowed for the call.
 *
 * Empty channel maps are replaced with the satellite's defaults.
 */
struct CompositeRequest {
  const core::SatelliteScan* scan{nullptr};
  const core::ChannelDataSet* data{nullptr};
  config::ChannelArgMap pvis_arg_map{};
  config::ChannelArgMap vis_arg_map{};
  std::string pvis_algorithm{pvis::kMainTwoEq};
  std::string vis_algorithm{vis::kVisDispSza};
  bool use_saved_params{true};
  std::string output_resolution{"both"};
};

/**
 * @brief Composites at the requested resolutions plus the ranges involved.
 */
struct CompositeResult {
  std::optional<core::Raster> composite_05km{};
  std::optional<core::Raster> composite_2km{};
  norm::NormalizationRange pvis_range{};
  norm::NormalizationRange vis_range{};
  core::Status status{core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Parse `"2.0km"`, `"0.5km"` or `"both"`, ignoring case and surrounding space.
 */
[[nodiscard]] std::optional<core::OutputResolution> parse_output_resolution(std::string_view text);

/**
 * @brief Per-pixel day/night merge on one grid.
 *
 * Night pixels take `night_scale * pvis`, day pixels take `vis`. Pixels that
 * end up non-finite take the finite maximum of the merged field; when no pixel
 * is finite the result is all NaN.
 */
[[nodiscard]] core::Raster merge_day_night(const core::Raster& pvis, const core::Raster& vis,
                                           const core::Raster& sza_deg, double threshold_deg, double night_scale);

class GeoProxyVisCompositor {
 public:
  struct Config {
    double sza_threshold_deg{core::constants::kSzaNightThresholdDeg};
    double vis_scaling_factor{core::constants::kVisScalingFactor};
  };

  GeoProxyVisCompositor(const norm::SavedRangeTable& table, const regrid::IResampler& resampler, const Config& config)
      : table_(table), resampler_(resampler), config_(config) {}

  GeoProxyVisCompositor(const norm::SavedRangeTable& table, const regrid::IResampler& resampler)
      : GeoProxyVisCompositor(table, resampler, Config{}) {}

  /**
   * @brief Build the composites for one scan.
   *
   * Enumerated arguments are validated before any raster is read. Any failure
   * fails the whole call and leaves both composites empty.
   */
  [[nodiscard]] CompositeResult evaluate(const CompositeRequest& request) const;

 private:
  const norm::SavedRangeTable& table_;
  const regrid::IResampler& resampler_;
  Config config_{};
};

}  // namespace geoproxyvis::composite
