/**
 * @file proxy_vis_model.hpp
 * @brief Nighttime ProxyVis model interface, registry and normalized product.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "geoproxyvis/core/channel_data.hpp"
#include "geoproxyvis/core/types.hpp"
#include "geoproxyvis/norm/normalization.hpp"
#include "geoproxyvis/norm/saved_range_table.hpp"

namespace geoproxyvis::pvis {

inline constexpr std::string_view kMainTwoEq = "nighttime_pvis_main_two_eq";
inline constexpr std::string_view kMainOneEq = "nighttime_pvis_main_one_eq";
inline constexpr std::string_view kSimpleTwoEq = "nighttime_pvis_simple_two_eq";
inline constexpr std::string_view kSimpleOneEq = "nighttime_pvis_simple_one_eq";

/**
 * @brief Raw regression output of one ProxyVis model.
 */
struct ProxyVisResult {
  core::Raster regression{};
  core::Status status{core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Normalized ProxyVis with the regression and range it came from.
 */
struct ProxyVisProduct {
  core::Raster proxy_vis{};
  core::Raster regression{};
  norm::NormalizationRange range{};
  core::Status status{core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Interface for nighttime ProxyVis regressions over IR brightness temperatures.
 */
class IProxyVisModel {
 public:
  virtual ~IProxyVisModel() = default;
  /**
   * @brief Registry name of the model.
   */
  [[nodiscard]] virtual std::string_view name() const = 0;
  /**
   * @brief Argument names the model reads (`c07`, `c11`, `c13`, `c15`).
   */
  [[nodiscard]] virtual const std::vector<std::string>& required_args() const = 0;
  /**
   * @brief Evaluate the regression elementwise.
   * @param args Brightness temperatures in K keyed by argument name, one shape.
   * @return Regression raster; NaN wherever an input is NaN.
   */
  [[nodiscard]] virtual ProxyVisResult evaluate(const core::ChannelArgs& args) const = 0;
};

/**
 * @brief Check that every required argument is present, non-null and of one shape.
 * @return `Ok`, or a failed result naming the model and argument.
 */
[[nodiscard]] ProxyVisResult validate_args(const core::ChannelArgs& args, const std::vector<std::string>& required,
                                           std::string_view model);

/**
 * @brief Look up a model by registry name.
 * @return Model instance with static lifetime, or nullptr for unknown names.
 */
[[nodiscard]] const IProxyVisModel* find_proxy_vis_model(std::string_view name);

/**
 * @brief Registry names in a stable order.
 */
[[nodiscard]] std::vector<std::string_view> proxy_vis_model_names();

/**
 * @brief Run a model and normalize its output.
 * @param model Model to evaluate.
 * @param args Brightness temperature arguments.
 * @param satellite Satellite name used for the saved range lookup.
 * @param use_saved_params Use the saved range instead of the field's own min/max.
 *        Dynamic ranges are only meaningful for full-disk input.
 * @param table Saved range table.
 */
[[nodiscard]] ProxyVisProduct compute_proxy_vis(const IProxyVisModel& model, const core::ChannelArgs& args,
                                                std::string_view satellite, bool use_saved_params,
                                                const norm::SavedRangeTable& table);

}  // namespace geoproxyvis::pvis
