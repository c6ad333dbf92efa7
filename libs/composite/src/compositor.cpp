/**
 * @file compositor.cpp
 * @brief Day/night GeoProxyVis composite pipeline implementation.
 * @author Watosn
 */

#include "geoproxyvis/composite/compositor.hpp"

#include <limits>
#include <utility>

#include <fmt/format.h>

#include "geoproxyvis/core/satellite.hpp"
#include "geoproxyvis/core/transforms.hpp"
#include "geoproxyvis/solar/solar_zenith.hpp"

namespace geoproxyvis::composite {
namespace {

CompositeResult fail(core::Status status, std::string detail) {
  CompositeResult out{};
  out.status = status;
  out.detail = std::move(detail);
  return out;
}

}  // namespace

std::optional<core::OutputResolution> parse_output_resolution(std::string_view text) {
  const std::string key = core::sanitize_keyword(text);
  if (key == "2.0km") {
    return core::OutputResolution::Km2;
  }
  if (key == "0.5km") {
    return core::OutputResolution::Km05;
  }
  if (key == "both") {
    return core::OutputResolution::Both;
  }
  return std::nullopt;
}

core::Raster merge_day_night(const core::Raster& pvis, const core::Raster& vis, const core::Raster& sza_deg,
                             double threshold_deg, double night_scale) {
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
  const auto mask = solar::classify_day_night(sza_deg, threshold_deg);
  const core::Raster day = mask.day.select(vis, kNaN);
  const core::Raster merged = mask.night.select(night_scale * pvis, day);
  const core::MaskRaster finite = merged.isFinite();
  if (!finite.any()) {
    // Nothing to take a maximum of; the field stays invalid.
    return core::Raster::Constant(merged.rows(), merged.cols(), kNaN);
  }
  const auto range = norm::finite_range(merged);
  return finite.select(merged, range.max);
}

CompositeResult GeoProxyVisCompositor::evaluate(const CompositeRequest& request) const {
  const auto resolution = parse_output_resolution(request.output_resolution);
  if (!resolution) {
    return fail(core::Status::InvalidInput,
                fmt::format("output_resolution '{}' is not one of 2.0km, 0.5km, both", request.output_resolution));
  }
  if (request.scan == nullptr || request.data == nullptr) {
    return fail(core::Status::InvalidInput, "request has no scan or channel data");
  }
  const core::SatelliteScan& scan = *request.scan;
  const auto satellite = core::parse_satellite(scan.satellite);
  if (!satellite) {
    return fail(core::Status::UnsupportedSatellite, fmt::format("satellite '{}' is not supported", scan.satellite));
  }
  const pvis::IProxyVisModel* pvis_model = pvis::find_proxy_vis_model(request.pvis_algorithm);
  if (pvis_model == nullptr) {
    return fail(core::Status::UnknownAlgorithm,
                fmt::format("unknown ProxyVis algorithm '{}'", request.pvis_algorithm));
  }
  const vis::IVisModel* vis_model = vis::find_vis_model(request.vis_algorithm);
  if (vis_model == nullptr) {
    return fail(core::Status::UnknownAlgorithm, fmt::format("unknown VIS algorithm '{}'", request.vis_algorithm));
  }
  if (request.use_saved_params && table_.lookup(scan.satellite, pvis_model->name()).status != core::Status::Ok) {
    return fail(core::Status::DataUnavailable,
                fmt::format("no saved ProxyVis range for {} / {}", scan.satellite, pvis_model->name()));
  }
  if (!core::same_shape(scan.lons_2km, scan.lats_2km) || !core::same_shape(scan.lons_05km, scan.lats_05km)) {
    return fail(core::Status::ShapeMismatch, "lon/lat grids of one resolution differ in shape");
  }

  const core::Epoch midpoint = core::scan_midpoint(scan.scan_start, scan.scan_minutes);

  const auto pvis_map = request.pvis_arg_map.bindings.empty()
                            ? config::default_pvis_arg_map(*satellite, pvis_model->name())
                            : request.pvis_arg_map;
  const auto pvis_args =
      config::resolve_channel_args(*request.data, pvis_map, pvis_model->required_args(), pvis_model->name());
  if (pvis_args.status != core::Status::Ok) {
    return fail(pvis_args.status, pvis_args.detail);
  }
  const auto product =
      pvis::compute_proxy_vis(*pvis_model, pvis_args.args, scan.satellite, request.use_saved_params, table_);
  if (product.status != core::Status::Ok) {
    return fail(product.status, product.detail);
  }
  if (!core::same_shape(product.proxy_vis, scan.lons_2km)) {
    return fail(core::Status::ShapeMismatch,
                fmt::format("{} output is {}x{}, 2 km grid is {}x{}", pvis_model->name(), product.proxy_vis.rows(),
                            product.proxy_vis.cols(), scan.lons_2km.rows(), scan.lons_2km.cols()));
  }

  const auto sza_05km = solar::solar_zenith_angle(midpoint, scan.lons_05km, scan.lats_05km);
  if (sza_05km.status != core::Status::Ok) {
    return fail(sza_05km.status, "0.5 km SZA failed");
  }
  const auto vis_map =
      request.vis_arg_map.bindings.empty() ? config::default_vis_arg_map(*satellite) : request.vis_arg_map;
  const auto vis_args =
      config::resolve_channel_args(*request.data, vis_map, vis_model->required_args(), vis_model->name());
  if (vis_args.status != core::Status::Ok) {
    return fail(vis_args.status, vis_args.detail);
  }
  const auto vis_result = vis_model->evaluate(vis_args.args, sza_05km.sza_deg, config_.sza_threshold_deg);
  if (vis_result.status != core::Status::Ok) {
    return fail(vis_result.status, vis_result.detail);
  }

  CompositeResult out{};
  out.pvis_range = product.range;
  out.vis_range = vis_result.range;

  const bool want_05km = *resolution != core::OutputResolution::Km2;
  const bool want_2km = *resolution != core::OutputResolution::Km05;

  if (want_05km) {
    const auto pvis_05km =
        resampler_.resample(scan.lons_2km, scan.lats_2km, product.proxy_vis, scan.lons_05km, scan.lats_05km);
    if (pvis_05km.status != core::Status::Ok) {
      return fail(pvis_05km.status, "resampling ProxyVis to 0.5 km failed");
    }
    out.composite_05km = merge_day_night(pvis_05km.data, vis_result.adjusted, sza_05km.sza_deg,
                                         config_.sza_threshold_deg, config_.vis_scaling_factor);
  }

  if (want_2km) {
    const auto sza_2km = solar::solar_zenith_angle(midpoint, scan.lons_2km, scan.lats_2km);
    if (sza_2km.status != core::Status::Ok) {
      return fail(sza_2km.status, "2 km SZA failed");
    }
    const auto vis_2km =
        resampler_.resample(scan.lons_05km, scan.lats_05km, vis_result.adjusted, scan.lons_2km, scan.lats_2km);
    if (vis_2km.status != core::Status::Ok) {
      return fail(vis_2km.status, "resampling VIS to 2 km failed");
    }
    out.composite_2km = merge_day_night(product.proxy_vis, vis_2km.data, sza_2km.sza_deg, config_.sza_threshold_deg,
                                        config_.vis_scaling_factor);
  }
  return out;
}

}  // namespace geoproxyvis::composite
