/**
 * @file vis_model.hpp
 * @brief Daytime visible adjustment interface and the SZA-corrected display model.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "geoproxyvis/core/channel_data.hpp"
#include "geoproxyvis/core/constants.hpp"
#include "geoproxyvis/core/types.hpp"
#include "geoproxyvis/norm/normalization.hpp"

namespace geoproxyvis::vis {

inline constexpr std::string_view kVisDispSza = "vis_disp_sza";

/**
 * @brief Adjusted visible field and the reflectance range observed.
 */
struct VisResult {
  core::Raster adjusted{};
  norm::NormalizationRange range{};
  core::Status status{core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Interface for daytime visible display models.
 */
class IVisModel {
 public:
  virtual ~IVisModel() = default;
  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual const std::vector<std::string>& required_args() const = 0;
  /**
   * @brief Adjust visible reflectance for display.
   * @param args Reflectance rasters keyed by argument name.
   * @param sza_deg Solar zenith angle on the same grid.
   * @param night_threshold_deg Pixels with a larger SZA are night and get NaN.
   */
  [[nodiscard]] virtual VisResult evaluate(const core::ChannelArgs& args, const core::Raster& sza_deg,
                                           double night_threshold_deg) const = 0;
};

/**
 * @brief Reflectance divided by cos(SZA) under a square-root display stretch.
 *
 * Reflectance is clamped to [0, 1.3] first. Pixels beyond the night threshold
 * carry no usable signal and are NaN; the threshold comes from the caller so
 * it matches the day/night mask used at merge time.
 */
class VisDispSzaModel final : public IVisModel {
 public:
  [[nodiscard]] std::string_view name() const override { return kVisDispSza; }
  [[nodiscard]] const std::vector<std::string>& required_args() const override;
  [[nodiscard]] VisResult evaluate(const core::ChannelArgs& args, const core::Raster& sza_deg,
                                   double night_threshold_deg) const override;
};

/**
 * @brief Look up a visible model by registry name; nullptr when unknown.
 */
[[nodiscard]] const IVisModel* find_vis_model(std::string_view name);

[[nodiscard]] std::vector<std::string_view> vis_model_names();

}  // namespace geoproxyvis::vis
