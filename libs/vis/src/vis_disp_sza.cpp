/**
 * @file vis_disp_sza.cpp
 * @brief SZA-corrected visible display model and registry.
 * @author Watosn
 */

#include "geoproxyvis/vis/vis_model.hpp"

#include <limits>

#include <fmt/format.h>

#include "geoproxyvis/core/satellite.hpp"

namespace geoproxyvis::vis {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const VisDispSzaModel kVisDispSzaModel{};

}  // namespace

const std::vector<std::string>& VisDispSzaModel::required_args() const {
  static const std::vector<std::string> args{"c02"};
  return args;
}

VisResult VisDispSzaModel::evaluate(const core::ChannelArgs& args, const core::Raster& sza_deg,
                                    double night_threshold_deg) const {
  const auto it = args.find("c02");
  if (it == args.end() || it->second == nullptr) {
    return VisResult{.status = core::Status::MissingChannel,
                     .detail = fmt::format("{}: missing argument 'c02'", name())};
  }
  const core::Raster& c02 = *it->second;
  if (!core::same_shape(c02, sza_deg)) {
    return VisResult{.status = core::Status::ShapeMismatch,
                     .detail = fmt::format("{}: c02 is {}x{}, SZA is {}x{}", name(), c02.rows(), c02.cols(),
                                           sza_deg.rows(), sza_deg.cols())};
  }

  using core::constants::kVisValidMax;
  using core::constants::kVisValidMin;
  // NaN stays NaN: both comparisons are false for it.
  const core::Raster upper = (c02 > kVisValidMax).select(kVisValidMax, c02);
  const core::Raster clamped = (upper < kVisValidMin).select(kVisValidMin, upper);

  const core::Raster cos_sza = (sza_deg * core::constants::kDegToRad).cos();
  const core::Raster stretched = (clamped / cos_sza).sqrt();
  const core::MaskRaster lit = sza_deg <= night_threshold_deg;

  VisResult out{};
  out.adjusted = lit.select(stretched, kNaN);
  out.range = norm::finite_range(clamped);
  return out;
}

const IVisModel* find_vis_model(std::string_view name) {
  if (core::sanitize_keyword(name) == kVisDispSza) {
    return &kVisDispSzaModel;
  }
  return nullptr;
}

std::vector<std::string_view> vis_model_names() { return {kVisDispSza}; }

}  // namespace geoproxyvis::vis
