/**
 * @file test_channel_arg_maps.cpp
 * @brief Channel map tables and argument resolution tests.
 * @author Watosn
 */

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "geoproxyvis/config/channel_arg_maps.hpp"

int main() {
  using namespace geoproxyvis;
  using core::FieldType;
  using core::Raster;

  const auto abi_main = config::default_pvis_arg_map(core::Satellite::Goes16, "nighttime_pvis_main_two_eq");
  const auto* c13 = abi_main.find("c13");
  if (abi_main.bindings.size() != 4U || c13 == nullptr || c13->channel != "C13" ||
      c13->field_type != FieldType::BtTemp) {
    spdlog::error("ABI main map mismatch");
    return 1;
  }

  const auto ahi_simple = config::default_pvis_arg_map(core::Satellite::Himawari9, "nighttime_pvis_simple_one_eq");
  if (ahi_simple.bindings.size() != 1U || ahi_simple.find("c07") == nullptr ||
      ahi_simple.find("c07")->channel != "B07") {
    spdlog::error("AHI simple map mismatch");
    return 2;
  }

  const auto seviri_main = config::default_pvis_arg_map(core::Satellite::Meteosat10, "nighttime_pvis_main_one_eq");
  const auto seviri_vis = config::default_vis_arg_map(core::Satellite::Meteosat11);
  if (seviri_main.find("c07")->channel != "IR_039" || seviri_main.find("c11")->channel != "IR_087" ||
      seviri_main.find("c15")->channel != "IR_120" || seviri_vis.find("c02") == nullptr ||
      seviri_vis.find("c02")->channel != "VIS006" || seviri_vis.find("c02")->field_type != FieldType::Radiances) {
    spdlog::error("SEVIRI maps mismatch");
    return 3;
  }
  if (config::default_vis_arg_map(core::Satellite::Himawari8).find("c02")->channel != "B03" ||
      config::default_vis_arg_map(core::Satellite::Goes18).find("c02")->channel != "C02") {
    spdlog::error("VIS channel mismatch");
    return 4;
  }

  core::ChannelDataSet data{};
  data.set(FieldType::BtTemp, "C07", Raster::Constant(2, 3, 280.0));
  data.set(FieldType::BtTemp, "C11", Raster::Constant(2, 3, 279.0));
  data.set(FieldType::BtTemp, "C13", Raster::Constant(2, 3, 281.0));
  data.set(FieldType::Radiances, "C02", Raster::Constant(4, 6, 0.3));

  const std::vector<std::string> four{"c07", "c11", "c13", "c15"};
  const auto missing = config::resolve_channel_args(data, abi_main, four, "nighttime_pvis_main_two_eq");
  if (missing.status != core::Status::MissingChannel || missing.detail.find("c15") == std::string::npos ||
      missing.detail.find("nighttime_pvis_main_two_eq") == std::string::npos) {
    spdlog::error("missing C15 not reported: {}", missing.detail);
    return 5;
  }

  data.set(FieldType::BtTemp, "C15", Raster::Constant(2, 3, 282.0));
  const auto resolved = config::resolve_channel_args(data, abi_main, four, "nighttime_pvis_main_two_eq");
  if (resolved.status != core::Status::Ok || resolved.args.size() != 4U ||
      resolved.args.at("c15") != data.find(FieldType::BtTemp, "C15")) {
    spdlog::error("resolution failed: {}", resolved.detail);
    return 6;
  }

  // The VIS map binds c02, which the simple regression does not take.
  const std::vector<std::string> one{"c07"};
  const auto unexpected = config::resolve_channel_args(data, config::default_vis_arg_map(core::Satellite::Goes16), one,
                                                       "nighttime_pvis_simple_one_eq");
  if (unexpected.status != core::Status::InvalidInput) {
    spdlog::error("unexpected binding accepted");
    return 7;
  }

  const config::ChannelArgMap unbound{.bindings = {{.arg = "c07", .field_type = FieldType::BtTemp, .channel = "C07"}}};
  if (config::resolve_channel_args(data, unbound, four, "nighttime_pvis_main_one_eq").status !=
      core::Status::MissingChannel) {
    spdlog::error("unbound argument accepted");
    return 8;
  }

  data.set(FieldType::BtTemp, "C11", Raster::Constant(3, 3, 279.0));
  if (config::resolve_channel_args(data, abi_main, four, "nighttime_pvis_main_two_eq").status !=
      core::Status::ShapeMismatch) {
    spdlog::error("shape mismatch accepted");
    return 9;
  }

  // The wrong field type is not a match.
  const config::ChannelArgMap wrong_type{
      .bindings = {{.arg = "c02", .field_type = FieldType::BtTemp, .channel = "C02"}}};
  if (config::resolve_channel_args(data, wrong_type, {"c02"}, "vis_disp_sza").status != core::Status::MissingChannel) {
    spdlog::error("field type ignored during lookup");
    return 10;
  }

  return 0;
}
