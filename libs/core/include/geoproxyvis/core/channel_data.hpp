/**
 * @file channel_data.hpp
 * @brief Two-level channel container: field type -> channel name -> raster.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>

#include "geoproxyvis/core/types.hpp"

namespace geoproxyvis::core {

/**
 * @brief Calibrated channel rasters of one scan, grouped by field type.
 *
 * Rasters of one field type are expected on one grid (IR channels at 2 km,
 * visible at 0.5 km); the container itself does not enforce shapes.
 */
class ChannelDataSet {
 public:
  /**
   * @brief Insert or replace a channel raster.
   */
  void set(FieldType type, const std::string& channel, Raster data) { fields_[type][channel] = std::move(data); }

  /**
   * @brief Look up a channel raster.
   * @return Pointer into the container, or nullptr when absent.
   */
  [[nodiscard]] const Raster* find(FieldType type, const std::string& channel) const {
    const auto ft = fields_.find(type);
    if (ft == fields_.end()) {
      return nullptr;
    }
    const auto ch = ft->second.find(channel);
    return ch == ft->second.end() ? nullptr : &ch->second;
  }

  [[nodiscard]] bool contains(FieldType type, const std::string& channel) const { return find(type, channel) != nullptr; }

  [[nodiscard]] std::size_t size() const {
    std::size_t n = 0;
    for (const auto& [type, channels] : fields_) {
      n += channels.size();
    }
    return n;
  }

  [[nodiscard]] const std::map<FieldType, std::map<std::string, Raster>>& fields() const { return fields_; }

 private:
  std::map<FieldType, std::map<std::string, Raster>> fields_{};
};

/**
 * @brief Function-argument name -> raster view handed to algorithm models.
 */
using ChannelArgs = std::map<std::string, const Raster*>;

}  // namespace geoproxyvis::core
