/**
 * @file nighttime_models.cpp
 * @brief Nighttime ProxyVis regression implementations.
 * @author Watosn
 */

#include "geoproxyvis/pvis/nighttime_models.hpp"

#include <limits>

namespace geoproxyvis::pvis {
namespace {

using core::ChannelArgs;
using core::Raster;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const std::vector<std::string>& four_channel_args() {
  static const std::vector<std::string> args{"c07", "c11", "c13", "c15"};
  return args;
}

const std::vector<std::string>& single_channel_args() {
  static const std::vector<std::string> args{"c07"};
  return args;
}

/**
 * @brief `p3 + p2 * c07^5 + p1 * ln(max(|c11 - c07|, floor)) + p0 * |c13 - c15|^0.4`.
 */
Raster multi_channel_terms(const std::array<double, 4>& p, const Raster& c07, const Raster& c11, const Raster& c13,
                           const Raster& c15) {
  const Raster log_term = (c11 - c07).abs().max(kMinLogValue).log();
  const Raster split_term = (c13 - c15).abs().pow(0.4);
  return p[3] + p[2] * c07.pow(5.0) + p[1] * log_term + p[0] * split_term;
}

Raster single_channel_terms(const std::array<double, 2>& p, const Raster& c07) { return p[1] + p[0] * c07.pow(5.0); }

// max() does not reliably carry NaN through, so missing pixels are restored explicitly.
Raster restore_nan(const Raster& tt, const core::MaskRaster& missing) { return missing.select(kNaN, tt); }

}  // namespace

const std::vector<std::string>& MainTwoEqModel::required_args() const { return four_channel_args(); }

ProxyVisResult MainTwoEqModel::evaluate(const ChannelArgs& args) const {
  ProxyVisResult out = validate_args(args, required_args(), name());
  if (out.status != core::Status::Ok) {
    return out;
  }
  const Raster& c07 = *args.at("c07");
  const Raster& c11 = *args.at("c11");
  const Raster& c13 = *args.at("c13");
  const Raster& c15 = *args.at("c15");

  const core::MaskRaster low_cloud = c07 >= kLowCloudThresholdK;
  const Raster low = multi_channel_terms(kLowCloudParams, c07, c11, c13, c15);
  const Raster high = multi_channel_terms(kHighCloudParams, c07, c11, c13, c15);
  const core::MaskRaster missing = c07.isNaN() || c11.isNaN() || c13.isNaN() || c15.isNaN();
  out.regression = restore_nan(low_cloud.select(low, high), missing);
  return out;
}

const std::vector<std::string>& MainOneEqModel::required_args() const { return four_channel_args(); }

ProxyVisResult MainOneEqModel::evaluate(const ChannelArgs& args) const {
  ProxyVisResult out = validate_args(args, required_args(), name());
  if (out.status != core::Status::Ok) {
    return out;
  }
  const Raster& c07 = *args.at("c07");
  const Raster& c11 = *args.at("c11");
  const Raster& c13 = *args.at("c13");
  const Raster& c15 = *args.at("c15");

  const core::MaskRaster missing = c07.isNaN() || c11.isNaN() || c13.isNaN() || c15.isNaN();
  out.regression = restore_nan(multi_channel_terms(kParams, c07, c11, c13, c15), missing);
  return out;
}

const std::vector<std::string>& SimpleTwoEqModel::required_args() const { return single_channel_args(); }

ProxyVisResult SimpleTwoEqModel::evaluate(const ChannelArgs& args) const {
  ProxyVisResult out = validate_args(args, required_args(), name());
  if (out.status != core::Status::Ok) {
    return out;
  }
  const Raster& c07 = *args.at("c07");
  const core::MaskRaster low_cloud = c07 >= kLowCloudThresholdK;
  const Raster low = single_channel_terms(kLowCloudParams, c07);
  const Raster high = single_channel_terms(kHighCloudParams, c07);
  out.regression = restore_nan(low_cloud.select(low, high), c07.isNaN());
  return out;
}

const std::vector<std::string>& SimpleOneEqModel::required_args() const { return single_channel_args(); }

ProxyVisResult SimpleOneEqModel::evaluate(const ChannelArgs& args) const {
  ProxyVisResult out = validate_args(args, required_args(), name());
  if (out.status != core::Status::Ok) {
    return out;
  }
  out.regression = single_channel_terms(kParams, *args.at("c07"));
  return out;
}

}  // namespace geoproxyvis::pvis
