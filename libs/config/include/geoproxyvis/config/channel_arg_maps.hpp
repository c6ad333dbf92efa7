/**
 * @file channel_arg_maps.hpp
 * @brief Maps from satellite channel names to ProxyVis/VIS function arguments.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "geoproxyvis/core/channel_data.hpp"
#include "geoproxyvis/core/satellite.hpp"
#include "geoproxyvis/core/types.hpp"

namespace geoproxyvis::config {

/**
 * @brief Which function family a map feeds.
 */
enum class ArgMapKind : std::uint8_t { Main, Simple, Vis };

/**
 * @brief One function argument bound to a channel of the input data set.
 */
struct ChannelBinding {
  std::string arg{};
  core::FieldType field_type{core::FieldType::BtTemp};
  std::string channel{};
};

/**
 * @brief Argument bindings for one (sensor family, function family) pair.
 *
 * Channel names follow the Satpy reader conventions; readers with other
 * naming need their own map.
 */
struct ChannelArgMap {
  std::vector<ChannelBinding> bindings{};

  [[nodiscard]] const ChannelBinding* find(std::string_view arg) const {
    for (const auto& b : bindings) {
      if (b.arg == arg) {
        return &b;
      }
    }
    return nullptr;
  }
};

/**
 * @brief Argument views resolved from a data set, with status.
 */
struct ResolvedArgs {
  core::ChannelArgs args{};
  core::Status status{core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Constant map for an imager family and function family.
 */
[[nodiscard]] ChannelArgMap channel_arg_map(core::SensorFamily family, ArgMapKind kind);

/**
 * @brief Map for the ProxyVis function family of `algorithm` on `satellite`.
 *
 * Names containing `main` get the four-channel map, others the single-channel map.
 */
[[nodiscard]] ChannelArgMap default_pvis_arg_map(core::Satellite satellite, std::string_view algorithm);

/**
 * @brief Map for the visible channel on `satellite`.
 */
[[nodiscard]] ChannelArgMap default_vis_arg_map(core::Satellite satellite);

/**
 * @brief Resolve the arguments of `function` against a channel data set.
 * @param data Input channel rasters.
 * @param map Argument bindings.
 * @param required Argument names the function takes.
 * @param function Function name used in error details.
 * @return `MissingChannel` when an argument is unbound or its channel is absent,
 *         `InvalidInput` when the map binds an argument the function does not take,
 *         `ShapeMismatch` when resolved rasters differ in shape.
 */
[[nodiscard]] ResolvedArgs resolve_channel_args(const core::ChannelDataSet& data, const ChannelArgMap& map,
                                                const std::vector<std::string>& required, std::string_view function);

}  // namespace geoproxyvis::config
