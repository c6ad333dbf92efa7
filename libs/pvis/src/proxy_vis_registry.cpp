/**
 * @file proxy_vis_registry.cpp
 * @brief ProxyVis model registry, argument validation and normalized product.
 * @author Watosn
 */

#include "geoproxyvis/pvis/proxy_vis_model.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>

#include "geoproxyvis/core/satellite.hpp"
#include "geoproxyvis/pvis/nighttime_models.hpp"

namespace geoproxyvis::pvis {
namespace {

const MainTwoEqModel kMainTwoEqModel{};
const MainOneEqModel kMainOneEqModel{};
const SimpleTwoEqModel kSimpleTwoEqModel{};
const SimpleOneEqModel kSimpleOneEqModel{};

const std::array<const IProxyVisModel*, 4> kModels{&kMainTwoEqModel, &kMainOneEqModel, &kSimpleTwoEqModel,
                                                   &kSimpleOneEqModel};

}  // namespace

ProxyVisResult validate_args(const core::ChannelArgs& args, const std::vector<std::string>& required,
                             std::string_view model) {
  const core::Raster* reference = nullptr;
  for (const auto& arg : required) {
    const auto it = args.find(arg);
    if (it == args.end() || it->second == nullptr) {
      return ProxyVisResult{.status = core::Status::MissingChannel,
                            .detail = fmt::format("{}: missing argument '{}'", model, arg)};
    }
    if (reference == nullptr) {
      reference = it->second;
    } else if (!core::same_shape(*reference, *it->second)) {
      return ProxyVisResult{.status = core::Status::ShapeMismatch,
                            .detail = fmt::format("{}: argument '{}' is {}x{}, expected {}x{}", model, arg,
                                                  it->second->rows(), it->second->cols(), reference->rows(),
                                                  reference->cols())};
    }
  }
  return ProxyVisResult{};
}

const IProxyVisModel* find_proxy_vis_model(std::string_view name) {
  const std::string key = core::sanitize_keyword(name);
  for (const auto* m : kModels) {
    if (m->name() == key) {
      return m;
    }
  }
  return nullptr;
}

std::vector<std::string_view> proxy_vis_model_names() {
  std::vector<std::string_view> names;
  names.reserve(kModels.size());
  for (const auto* m : kModels) {
    names.push_back(m->name());
  }
  return names;
}

ProxyVisProduct compute_proxy_vis(const IProxyVisModel& model, const core::ChannelArgs& args,
                                  std::string_view satellite, bool use_saved_params,
                                  const norm::SavedRangeTable& table) {
  norm::NormalizationRange saved{};
  if (use_saved_params) {
    const auto lookup = table.lookup(satellite, model.name());
    if (lookup.status != core::Status::Ok) {
      return ProxyVisProduct{.status = lookup.status,
                             .detail = fmt::format("{}: no saved range for satellite '{}'", model.name(), satellite)};
    }
    saved = lookup.range;
  }

  auto raw = model.evaluate(args);
  if (raw.status != core::Status::Ok) {
    return ProxyVisProduct{.status = raw.status, .detail = std::move(raw.detail)};
  }

  const auto mode = use_saved_params ? norm::NormalizationMode::Saved : norm::NormalizationMode::Dynamic;
  const auto normalized = norm::normalize_pvis(raw.regression, mode, saved);
  ProxyVisProduct out{};
  out.proxy_vis = normalized.values;
  out.regression = std::move(raw.regression);
  out.range = normalized.range;
  return out;
}

}  // namespace geoproxyvis::pvis
