/**
 * @file channel_arg_maps.cpp
 * @brief Channel-to-argument tables and argument resolution.
 * @author Watosn
 */

#include "geoproxyvis/config/channel_arg_maps.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace geoproxyvis::config {
namespace {

using core::FieldType;

ChannelArgMap four_channel_map(const char* c07, const char* c11, const char* c13, const char* c15) {
  return ChannelArgMap{.bindings = {{.arg = "c07", .field_type = FieldType::BtTemp, .channel = c07},
                                    {.arg = "c11", .field_type = FieldType::BtTemp, .channel = c11},
                                    {.arg = "c13", .field_type = FieldType::BtTemp, .channel = c13},
                                    {.arg = "c15", .field_type = FieldType::BtTemp, .channel = c15}}};
}

ChannelArgMap single_channel_map(const char* arg, FieldType type, const char* channel) {
  return ChannelArgMap{.bindings = {{.arg = arg, .field_type = type, .channel = channel}}};
}

}  // namespace

ChannelArgMap channel_arg_map(core::SensorFamily family, ArgMapKind kind) {
  switch (family) {
    case core::SensorFamily::Abi:
      if (kind == ArgMapKind::Main) {
        return four_channel_map("C07", "C11", "C13", "C15");
      }
      return kind == ArgMapKind::Simple ? single_channel_map("c07", FieldType::BtTemp, "C07")
                                        : single_channel_map("c02", FieldType::Radiances, "C02");
    case core::SensorFamily::Ahi:
      if (kind == ArgMapKind::Main) {
        return four_channel_map("B07", "B11", "B13", "B15");
      }
      return kind == ArgMapKind::Simple ? single_channel_map("c07", FieldType::BtTemp, "B07")
                                        : single_channel_map("c02", FieldType::Radiances, "B03");
    case core::SensorFamily::Seviri:
    default:
      if (kind == ArgMapKind::Main) {
        return four_channel_map("IR_039", "IR_087", "IR_108", "IR_120");
      }
      return kind == ArgMapKind::Simple ? single_channel_map("c07", FieldType::BtTemp, "IR_039")
                                        : single_channel_map("c02", FieldType::Radiances, "VIS006");
  }
}

ChannelArgMap default_pvis_arg_map(core::Satellite satellite, std::string_view algorithm) {
  const bool is_main = algorithm.find("main") != std::string_view::npos;
  return channel_arg_map(core::sensor_family(satellite), is_main ? ArgMapKind::Main : ArgMapKind::Simple);
}

ChannelArgMap default_vis_arg_map(core::Satellite satellite) {
  return channel_arg_map(core::sensor_family(satellite), ArgMapKind::Vis);
}

ResolvedArgs resolve_channel_args(const core::ChannelDataSet& data, const ChannelArgMap& map,
                                  const std::vector<std::string>& required, std::string_view function) {
  for (const auto& b : map.bindings) {
    if (std::find(required.begin(), required.end(), b.arg) == required.end()) {
      return ResolvedArgs{.status = core::Status::InvalidInput,
                          .detail = fmt::format("{}: unexpected argument '{}' in channel map", function, b.arg)};
    }
  }

  ResolvedArgs out{};
  const core::Raster* reference = nullptr;
  std::string reference_arg{};
  for (const auto& arg : required) {
    const auto* binding = map.find(arg);
    if (binding == nullptr) {
      return ResolvedArgs{.status = core::Status::MissingChannel,
                          .detail = fmt::format("{}: argument '{}' has no channel binding", function, arg)};
    }
    const auto* raster = data.find(binding->field_type, binding->channel);
    if (raster == nullptr) {
      return ResolvedArgs{.status = core::Status::MissingChannel,
                          .detail = fmt::format("{}: argument '{}' needs {}/{} which is not in the input", function, arg,
                                                core::field_type_to_string(binding->field_type), binding->channel)};
    }
    if (reference == nullptr) {
      reference = raster;
      reference_arg = arg;
    } else if (!core::same_shape(*reference, *raster)) {
      return ResolvedArgs{.status = core::Status::ShapeMismatch,
                          .detail = fmt::format("{}: argument '{}' is {}x{} but '{}' is {}x{}", function, arg,
                                                raster->rows(), raster->cols(), reference_arg, reference->rows(),
                                                reference->cols())};
    }
    out.args.emplace(arg, raster);
  }
  return out;
}

}  // namespace geoproxyvis::config
