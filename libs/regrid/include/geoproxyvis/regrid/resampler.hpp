/**
 * @file resampler.hpp
 * @brief Swath resampling interface and nearest-neighbour implementation.
 * @author Watosn
 */
#pragma once

#include <limits>
#include <memory>

#include "geoproxyvis/core/constants.hpp"
#include "geoproxyvis/core/types.hpp"

namespace geoproxyvis::regrid {

/**
 * @brief Resampled raster on the destination grid.
 */
struct ResampleResult {
  core::Raster data{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Moves a raster from one lon/lat swath to another.
 */
class IResampler {
 public:
  virtual ~IResampler() = default;
  /**
   * @brief Resample `src` defined on (`src_lons`, `src_lats`) onto the destination grid.
   * @return Raster shaped like `dst_lons`.
   */
  [[nodiscard]] virtual ResampleResult resample(const core::Raster& src_lons, const core::Raster& src_lats,
                                                const core::Raster& src, const core::Raster& dst_lons,
                                                const core::Raster& dst_lats) const = 0;
};

/**
 * @brief Nearest source pixel within a radius of influence, on a spherical Earth.
 *
 * Source points are binned in a uniform Cartesian cell grid whose cell edge
 * equals the radius, so each query only visits the 27 surrounding cells.
 */
class NearestNeighborResampler final : public IResampler {
 public:
  struct Config {
    double radius_of_influence_m{10000.0};
    double fill_value{std::numeric_limits<double>::quiet_NaN()};
    double earth_radius_m{core::constants::kEarthRadiusWgs84M};
  };

  static std::unique_ptr<NearestNeighborResampler> Create(const Config& config) {
    return std::make_unique<NearestNeighborResampler>(config);
  }

  explicit NearestNeighborResampler(const Config& config) : config_(config) {}

  [[nodiscard]] ResampleResult resample(const core::Raster& src_lons, const core::Raster& src_lats,
                                        const core::Raster& src, const core::Raster& dst_lons,
                                        const core::Raster& dst_lats) const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  Config config_{};
};

}  // namespace geoproxyvis::regrid
