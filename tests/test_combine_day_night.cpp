/**
 * @file test_combine_day_night.cpp
 * @brief Day/night composite pipeline tests.
 * @author Watosn
 */

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "geoproxyvis/composite/compositor.hpp"
#include "geoproxyvis/core/transforms.hpp"
#include "geoproxyvis/solar/solar_zenith.hpp"

namespace {

using geoproxyvis::core::FieldType;
using geoproxyvis::core::Raster;

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

// 2x2 IR pixels 0.02 deg apart with a 4x4 visible grid over the same area.
geoproxyvis::core::SatelliteScan make_scan(const std::string& satellite, geoproxyvis::core::Epoch start,
                                           double lon0 = 0.0) {
  geoproxyvis::core::SatelliteScan scan{};
  scan.satellite = satellite;
  scan.scan_start = start;
  scan.scan_minutes = 0;
  scan.lons_2km.resize(2, 2);
  scan.lats_2km.resize(2, 2);
  scan.lons_05km.resize(4, 4);
  scan.lats_05km.resize(4, 4);
  for (Eigen::Index r = 0; r < 2; ++r) {
    for (Eigen::Index c = 0; c < 2; ++c) {
      scan.lons_2km(r, c) = lon0 + 0.02 * static_cast<double>(c);
      scan.lats_2km(r, c) = -0.02 * static_cast<double>(r);
    }
  }
  for (Eigen::Index r = 0; r < 4; ++r) {
    for (Eigen::Index c = 0; c < 4; ++c) {
      scan.lons_05km(r, c) = lon0 - 0.0075 + 0.01 * static_cast<double>(c);
      scan.lats_05km(r, c) = 0.0075 - 0.01 * static_cast<double>(r);
    }
  }
  return scan;
}

geoproxyvis::core::ChannelDataSet make_abi_data(double bt_k, double reflectance) {
  geoproxyvis::core::ChannelDataSet data{};
  for (const char* ch : {"C07", "C11", "C13", "C15"}) {
    data.set(FieldType::BtTemp, ch, Raster::Constant(2, 2, bt_k));
  }
  data.set(FieldType::Radiances, "C02", Raster::Constant(4, 4, reflectance));
  return data;
}

geoproxyvis::composite::CompositeRequest make_request(const geoproxyvis::core::SatelliteScan& scan,
                                                      const geoproxyvis::core::ChannelDataSet& data) {
  geoproxyvis::composite::CompositeRequest req{};
  req.scan = &scan;
  req.data = &data;
  return req;
}

}  // namespace

int main() {
  using namespace geoproxyvis;
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

  if (composite::parse_output_resolution("2.0km") != core::OutputResolution::Km2 ||
      composite::parse_output_resolution(" 0.5KM ") != core::OutputResolution::Km05 ||
      composite::parse_output_resolution("Both") != core::OutputResolution::Both ||
      composite::parse_output_resolution("1km")) {
    spdlog::error("output resolution parsing mismatch");
    return 1;
  }

  Raster pvis(1, 5);
  pvis << 0.5, 0.2, kNaN, 0.4, 0.3;
  Raster vis(1, 5);
  vis << 0.9, 0.3, 0.7, kNaN, 0.8;
  Raster sza(1, 5);
  sza << 95.0, 10.0, 100.0, 20.0, kNaN;
  const Raster merged = composite::merge_day_night(pvis, vis, sza, 89.0, 1.3);
  if (!approx(merged(0, 0), 0.65, 1e-12) || !approx(merged(0, 1), 0.3, 1e-12) || !approx(merged(0, 2), 0.65, 1e-12) ||
      !approx(merged(0, 3), 0.65, 1e-12) || !approx(merged(0, 4), 0.65, 1e-12)) {
    spdlog::error("merge_day_night mismatch");
    return 2;
  }

  // No valid pixel anywhere: nothing to fill with.
  const Raster nan_sza = Raster::Constant(1, 5, kNaN);
  if (!composite::merge_day_night(pvis, vis, nan_sza, 89.0, 1.3).isNaN().all()) {
    spdlog::error("all-invalid merge was filled");
    return 26;
  }

  const auto table = norm::SavedRangeTable::Defaults();
  const auto resampler = regrid::NearestNeighborResampler::Create({});
  const composite::GeoProxyVisCompositor compositor(table, *resampler);

  // 00:00 UTC at the March equinox: the sun is over the date line, all pixels are night.
  const core::Epoch midnight = core::epoch_from_utc(2024, 3, 20, 0, 0, 0.0);
  const core::Epoch noon = core::epoch_from_utc(2024, 3, 20, 12, 0, 0.0);
  const auto night_scan = make_scan("goes16", midnight);
  const auto uniform = make_abi_data(250.0, 0.5);

  auto req = make_request(night_scan, uniform);
  req.use_saved_params = false;
  const auto night = compositor.evaluate(req);
  if (night.status != core::Status::Ok || !night.composite_05km || !night.composite_2km) {
    spdlog::error("night composite failed: {}", night.detail);
    return 3;
  }
  const double pvis_expected = 1.3 * std::pow(0.5, norm::kGammaCorrection);
  if (night.composite_2km->rows() != 2 || night.composite_2km->cols() != 2 || night.composite_05km->rows() != 4 ||
      night.composite_05km->cols() != 4 || ((*night.composite_2km - pvis_expected).abs() > 1e-12).any() ||
      ((*night.composite_05km - pvis_expected).abs() > 1e-12).any()) {
    spdlog::error("uniform night scene did not select ProxyVis everywhere");
    return 4;
  }
  if (!approx(night.pvis_range.min, night.pvis_range.max, 1e-15) || !approx(night.pvis_range.max, 0.7466, 1e-3) ||
      !approx(night.vis_range.min, 0.5, 1e-15) || !approx(night.vis_range.max, 0.5, 1e-15)) {
    spdlog::error("night ranges mismatch");
    return 5;
  }

  req.use_saved_params = true;
  const auto saved = compositor.evaluate(req);
  const double saved_expected = 1.3 * std::pow(night.pvis_range.max / 0.78, norm::kGammaCorrection);
  if (saved.status != core::Status::Ok || !approx(saved.pvis_range.max, 0.78, 1e-15) ||
      ((*saved.composite_2km - saved_expected).abs() > 1e-12).any()) {
    spdlog::error("saved-range night composite mismatch");
    return 6;
  }

  const auto day_scan = make_scan("goes16", noon);
  req.scan = &day_scan;
  const auto day = compositor.evaluate(req);
  if (day.status != core::Status::Ok) {
    spdlog::error("day composite failed: {}", day.detail);
    return 7;
  }
  const auto sza_05km = solar::solar_zenith_angle(noon, day_scan.lons_05km, day_scan.lats_05km);
  const Raster vis_expected = (0.5 / (sza_05km.sza_deg * core::constants::kDegToRad).cos()).sqrt();
  if (((*day.composite_05km - vis_expected).abs() > 1e-12).any() ||
      ((*day.composite_2km - std::sqrt(0.5)).abs() > 2e-3).any()) {
    spdlog::error("day scene did not select adjusted VIS");
    return 8;
  }

  req.output_resolution = "2.0km";
  const auto only_2km = compositor.evaluate(req);
  req.output_resolution = "0.5km";
  const auto only_05km = compositor.evaluate(req);
  req.output_resolution = " BOTH ";
  const auto both = compositor.evaluate(req);
  if (only_2km.status != core::Status::Ok || only_2km.composite_05km || !only_2km.composite_2km ||
      only_05km.status != core::Status::Ok || !only_05km.composite_05km || only_05km.composite_2km ||
      both.status != core::Status::Ok || !both.composite_05km || !both.composite_2km) {
    spdlog::error("output resolution selection mismatch");
    return 9;
  }

  // Near the terminator: apparent SZA about 89.25 deg over the whole scan.
  const double sun_lon = solar::solar_position(noon).subsolar_lon_deg;
  double lo = sun_lon + 80.0;
  double hi = sun_lon + 95.0;
  for (int i = 0; i < 60; ++i) {
    const double mid_lon = 0.5 * (lo + hi);
    if (solar::solar_zenith_deg(noon, 0.0, mid_lon) < 89.25) {
      lo = mid_lon;
    } else {
      hi = mid_lon;
    }
  }
  const auto dusk_scan = make_scan("goes16", noon, lo);
  const auto dusk_data = make_abi_data(250.0, 0.2);
  auto dusk_req = make_request(dusk_scan, dusk_data);
  dusk_req.output_resolution = "0.5km";
  const auto dusk_sza = solar::solar_zenith_angle(noon, dusk_scan.lons_05km, dusk_scan.lats_05km);
  if (!(dusk_sza.sza_deg > 89.0).all() || !(dusk_sza.sza_deg < 89.5).all()) {
    spdlog::error("terminator scan is not between 89 and 89.5 deg");
    return 23;
  }

  const auto dusk_default = compositor.evaluate(dusk_req);
  if (dusk_default.status != core::Status::Ok ||
      ((*dusk_default.composite_05km - saved_expected).abs() > 1e-12).any()) {
    spdlog::error("default threshold should treat the terminator scan as night");
    return 24;
  }

  const composite::GeoProxyVisCompositor wide_day(table, *resampler, {.sza_threshold_deg = 89.5});
  const auto dusk_wide = wide_day.evaluate(dusk_req);
  const Raster dusk_vis = (0.2 / (dusk_sza.sza_deg * core::constants::kDegToRad).cos()).sqrt();
  if (dusk_wide.status != core::Status::Ok || !dusk_wide.composite_05km ||
      ((*dusk_wide.composite_05km - dusk_vis).abs() > 1e-12).any() || dusk_vis.minCoeff() < 3.0) {
    spdlog::error("configured threshold did not reach the visible branch");
    return 25;
  }

  // Enumerated arguments fail before any raster is read: the data set is empty.
  const core::ChannelDataSet empty{};
  auto bad = make_request(night_scan, empty);
  bad.output_resolution = "1km";
  if (compositor.evaluate(bad).status != core::Status::InvalidInput) {
    spdlog::error("bad output resolution accepted");
    return 10;
  }
  bad.output_resolution = "both";
  const auto bogus_scan = make_scan("goes15", midnight);
  bad.scan = &bogus_scan;
  if (compositor.evaluate(bad).status != core::Status::UnsupportedSatellite) {
    spdlog::error("unsupported satellite accepted");
    return 11;
  }
  bad.scan = &night_scan;
  bad.pvis_algorithm = "nighttime_pvis_bogus";
  if (compositor.evaluate(bad).status != core::Status::UnknownAlgorithm) {
    spdlog::error("unknown ProxyVis algorithm accepted");
    return 12;
  }
  bad.pvis_algorithm = std::string(pvis::kMainTwoEq);
  bad.vis_algorithm = "vis_true_color";
  if (compositor.evaluate(bad).status != core::Status::UnknownAlgorithm) {
    spdlog::error("unknown VIS algorithm accepted");
    return 13;
  }
  bad.vis_algorithm = std::string(vis::kVisDispSza);
  bad.scan = nullptr;
  if (compositor.evaluate(bad).status != core::Status::InvalidInput) {
    spdlog::error("null scan accepted");
    return 14;
  }

  const norm::SavedRangeTable no_ranges(std::vector<norm::SavedRangeTable::Entry>{});
  const composite::GeoProxyVisCompositor no_range_compositor(no_ranges, *resampler);
  auto unsaved = make_request(night_scan, uniform);
  if (no_range_compositor.evaluate(unsaved).status != core::Status::DataUnavailable) {
    spdlog::error("missing saved range accepted");
    return 15;
  }
  unsaved.use_saved_params = false;
  if (no_range_compositor.evaluate(unsaved).status != core::Status::Ok) {
    spdlog::error("dynamic normalization should not need saved ranges");
    return 16;
  }

  auto partial = make_abi_data(250.0, 0.5);
  core::ChannelDataSet no_c15{};
  for (const char* ch : {"C07", "C11", "C13"}) {
    no_c15.set(FieldType::BtTemp, ch, *partial.find(FieldType::BtTemp, ch));
  }
  no_c15.set(FieldType::Radiances, "C02", *partial.find(FieldType::Radiances, "C02"));
  const auto missing = compositor.evaluate(make_request(night_scan, no_c15));
  if (missing.status != core::Status::MissingChannel || missing.detail.find("c15") == std::string::npos ||
      missing.composite_05km || missing.composite_2km) {
    spdlog::error("missing C15 not reported: {}", missing.detail);
    return 17;
  }

  partial.set(FieldType::BtTemp, "C11", Raster::Constant(3, 3, 250.0));
  if (compositor.evaluate(make_request(night_scan, partial)).status != core::Status::ShapeMismatch) {
    spdlog::error("channel shape mismatch accepted");
    return 18;
  }

  const auto off_grid = make_abi_data(250.0, 0.5);
  auto big_ir = off_grid;
  for (const char* ch : {"C07", "C11", "C13", "C15"}) {
    big_ir.set(FieldType::BtTemp, ch, Raster::Constant(3, 3, 250.0));
  }
  if (compositor.evaluate(make_request(night_scan, big_ir)).status != core::Status::ShapeMismatch) {
    spdlog::error("IR raster off the 2 km grid accepted");
    return 19;
  }

  core::ChannelDataSet no_vis{};
  for (const char* ch : {"C07", "C11", "C13", "C15"}) {
    no_vis.set(FieldType::BtTemp, ch, Raster::Constant(2, 2, 250.0));
  }
  const auto vis_missing = compositor.evaluate(make_request(night_scan, no_vis));
  if (vis_missing.status != core::Status::MissingChannel || vis_missing.detail.find("c02") == std::string::npos) {
    spdlog::error("missing visible channel not reported");
    return 20;
  }

  // AHI naming with the single-channel regression through the default maps.
  core::ChannelDataSet ahi{};
  ahi.set(FieldType::BtTemp, "B07", Raster::Constant(2, 2, 260.0));
  ahi.set(FieldType::Radiances, "B03", Raster::Constant(4, 4, 0.4));
  const auto ahi_scan = make_scan("himawari9", midnight);
  auto ahi_req = make_request(ahi_scan, ahi);
  ahi_req.pvis_algorithm = std::string(pvis::kSimpleOneEq);
  const auto ahi_out = compositor.evaluate(ahi_req);
  if (ahi_out.status != core::Status::Ok || !approx(ahi_out.pvis_range.max, 0.79, 1e-15)) {
    spdlog::error("himawari9 simple composite failed: {}", ahi_out.detail);
    return 21;
  }

  // Caller-supplied maps override the defaults.
  core::ChannelDataSet renamed{};
  renamed.set(FieldType::BtTemp, "ir39", Raster::Constant(2, 2, 250.0));
  renamed.set(FieldType::Radiances, "vis064", Raster::Constant(4, 4, 0.5));
  auto custom = make_request(night_scan, renamed);
  custom.pvis_algorithm = std::string(pvis::kSimpleTwoEq);
  custom.pvis_arg_map = config::ChannelArgMap{
      .bindings = {{.arg = "c07", .field_type = FieldType::BtTemp, .channel = "ir39"}}};
  custom.vis_arg_map = config::ChannelArgMap{
      .bindings = {{.arg = "c02", .field_type = FieldType::Radiances, .channel = "vis064"}}};
  if (compositor.evaluate(custom).status != core::Status::Ok) {
    spdlog::error("custom channel maps rejected");
    return 22;
  }

  return 0;
}
