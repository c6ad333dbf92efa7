/**
 * @file proxy_vis_cli.cpp
 * @brief Single-pixel ProxyVis regression with saved normalization.
 * @author Watosn
 */

#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geoproxyvis/core/satellite.hpp"
#include "geoproxyvis/norm/saved_range_table.hpp"
#include "geoproxyvis/pvis/proxy_vis_model.hpp"

int main(int argc, char** argv) {
  if (argc != 4 && argc != 7) {
    spdlog::error("usage: proxy_vis_cli <satellite> <algorithm> <c07_k> [c11_k c13_k c15_k]");
    for (const auto name : geoproxyvis::pvis::proxy_vis_model_names()) {
      spdlog::error("algorithm: {}", name);
    }
    return 1;
  }

  const std::string satellite = geoproxyvis::core::sanitize_keyword(argv[1]);
  if (!geoproxyvis::core::parse_satellite(satellite)) {
    spdlog::error("unsupported satellite: {}", argv[1]);
    return 2;
  }
  const auto* model = geoproxyvis::pvis::find_proxy_vis_model(argv[2]);
  if (model == nullptr) {
    spdlog::error("unknown algorithm: {}", argv[2]);
    return 3;
  }

  geoproxyvis::core::Raster c07 = geoproxyvis::core::Raster::Constant(1, 1, std::atof(argv[3]));
  geoproxyvis::core::Raster c11{};
  geoproxyvis::core::Raster c13{};
  geoproxyvis::core::Raster c15{};
  geoproxyvis::core::ChannelArgs args{{"c07", &c07}};
  if (argc == 7) {
    c11 = geoproxyvis::core::Raster::Constant(1, 1, std::atof(argv[4]));
    c13 = geoproxyvis::core::Raster::Constant(1, 1, std::atof(argv[5]));
    c15 = geoproxyvis::core::Raster::Constant(1, 1, std::atof(argv[6]));
    args.emplace("c11", &c11);
    args.emplace("c13", &c13);
    args.emplace("c15", &c15);
  }

  const auto table = geoproxyvis::norm::SavedRangeTable::Defaults();
  const auto product = geoproxyvis::pvis::compute_proxy_vis(*model, args, satellite, true, table);
  if (product.status != geoproxyvis::core::Status::Ok) {
    spdlog::error("{} failed: {} ({})", model->name(), geoproxyvis::core::status_to_string(product.status),
                  product.detail);
    return 4;
  }

  fmt::print("algorithm={} regression={} proxy_vis={} min={} max={}\n", model->name(), product.regression(0, 0),
             product.proxy_vis(0, 0), product.range.min, product.range.max);
  return 0;
}
