/**
 * @file test_vis_disp_sza.cpp
 * @brief Daytime visible adjustment tests.
 * @author Watosn
 */

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "geoproxyvis/core/constants.hpp"
#include "geoproxyvis/vis/vis_model.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace geoproxyvis;
  using core::Raster;
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
  constexpr double kThreshold = core::constants::kSzaNightThresholdDeg;

  const auto* model = vis::find_vis_model("VIS_DISP_SZA");
  if (model == nullptr || vis::find_vis_model("vis_true_color") != nullptr || vis::vis_model_names().size() != 1U) {
    spdlog::error("vis registry mismatch");
    return 1;
  }

  Raster c02(1, 6);
  c02 << 0.25, -0.1, 1.6, 0.5, kNaN, 0.5;
  Raster sza(1, 6);
  sza << 0.0, 10.0, 0.0, 60.0, 30.0, 89.5;

  const core::ChannelArgs args{{"c02", &c02}};
  const auto r = model->evaluate(args, sza, kThreshold);
  if (r.status != core::Status::Ok) {
    spdlog::error("vis_disp_sza failed: {}", r.detail);
    return 2;
  }
  if (!approx(r.adjusted(0, 0), 0.5, 1e-12) || !approx(r.adjusted(0, 1), 0.0, 1e-12) ||
      !approx(r.adjusted(0, 2), std::sqrt(core::constants::kVisValidMax), 1e-12) ||
      !approx(r.adjusted(0, 3), 1.0, 1e-12)) {
    spdlog::error("adjusted values mismatch");
    return 3;
  }
  if (!std::isnan(r.adjusted(0, 4)) || !std::isnan(r.adjusted(0, 5))) {
    spdlog::error("NaN reflectance or night pixel produced a value");
    return 4;
  }
  if (!approx(r.range.min, 0.0, 1e-15) || !approx(r.range.max, 1.3, 1e-15)) {
    spdlog::error("vis range mismatch: {} {}", r.range.min, r.range.max);
    return 5;
  }

  const Raster nan_sza = Raster::Constant(1, 6, kNaN);
  if (!model->evaluate(args, nan_sza, kThreshold).adjusted.isNaN().all()) {
    spdlog::error("NaN SZA produced a value");
    return 6;
  }

  const core::ChannelArgs none{};
  if (model->evaluate(none, sza, kThreshold).status != core::Status::MissingChannel) {
    spdlog::error("missing c02 accepted");
    return 7;
  }

  const Raster small = Raster::Constant(1, 3, 10.0);
  if (model->evaluate(args, small, kThreshold).status != core::Status::ShapeMismatch) {
    spdlog::error("c02/SZA shape mismatch accepted");
    return 8;
  }

  // A wider daylight window keeps pixels past 89 deg.
  const auto wide = model->evaluate(args, sza, 89.8);
  const double edge_expected = std::sqrt(0.5 / std::cos(89.5 * core::constants::kDegToRad));
  if (wide.status != core::Status::Ok || !approx(wide.adjusted(0, 5), edge_expected, 1e-9)) {
    spdlog::error("caller threshold not honoured");
    return 9;
  }

  return 0;
}
