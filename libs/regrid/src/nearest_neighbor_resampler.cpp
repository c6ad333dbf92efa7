/**
 * @file nearest_neighbor_resampler.cpp
 * @brief Cell-binned nearest-neighbour swath resampling.
 * @author Watosn
 */

#include "geoproxyvis/regrid/resampler.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include <Eigen/Dense>

namespace geoproxyvis::regrid {
namespace {

constexpr std::int64_t kCellOffset = std::int64_t{1} << 20;
constexpr std::int64_t kCellSpan = std::int64_t{1} << 21;

Eigen::Vector3d to_cartesian(double lon_deg, double lat_deg, double radius_m) {
  const double lon = lon_deg * core::constants::kDegToRad;
  const double lat = lat_deg * core::constants::kDegToRad;
  return Eigen::Vector3d(radius_m * std::cos(lat) * std::cos(lon), radius_m * std::cos(lat) * std::sin(lon),
                         radius_m * std::sin(lat));
}

struct CellIndex {
  std::int64_t x{};
  std::int64_t y{};
  std::int64_t z{};

  [[nodiscard]] std::int64_t key() const {
    return ((x + kCellOffset) * kCellSpan + (y + kCellOffset)) * kCellSpan + (z + kCellOffset);
  }
};

CellIndex cell_of(const Eigen::Vector3d& p, double cell_m) {
  return CellIndex{.x = static_cast<std::int64_t>(std::floor(p.x() / cell_m)),
                   .y = static_cast<std::int64_t>(std::floor(p.y() / cell_m)),
                   .z = static_cast<std::int64_t>(std::floor(p.z() / cell_m))};
}

}  // namespace

ResampleResult NearestNeighborResampler::resample(const core::Raster& src_lons, const core::Raster& src_lats,
                                                  const core::Raster& src, const core::Raster& dst_lons,
                                                  const core::Raster& dst_lats) const {
  if (!core::same_shape(src_lons, src_lats) || !core::same_shape(src_lons, src) ||
      !core::same_shape(dst_lons, dst_lats)) {
    return ResampleResult{.status = core::Status::ShapeMismatch};
  }
  const double radius = config_.radius_of_influence_m;
  if (!(radius > 0.0) || !std::isfinite(radius) || !(config_.earth_radius_m > 0.0) ||
      2.0 * config_.earth_radius_m / radius >= static_cast<double>(kCellOffset)) {
    return ResampleResult{.status = core::Status::InvalidInput};
  }

  std::vector<Eigen::Vector3d> points;
  std::unordered_map<std::int64_t, std::vector<Eigen::Index>> cells;
  points.resize(static_cast<std::size_t>(src.size()));
  for (Eigen::Index i = 0; i < src.size(); ++i) {
    const double lon = src_lons(i);
    const double lat = src_lats(i);
    if (!std::isfinite(lon) || !std::isfinite(lat)) {
      continue;
    }
    points[static_cast<std::size_t>(i)] = to_cartesian(lon, lat, config_.earth_radius_m);
    cells[cell_of(points[static_cast<std::size_t>(i)], radius).key()].push_back(i);
  }

  ResampleResult out{};
  out.data = core::Raster::Constant(dst_lons.rows(), dst_lons.cols(), config_.fill_value);
  const double radius_sq = radius * radius;
  for (Eigen::Index j = 0; j < dst_lons.size(); ++j) {
    const double lon = dst_lons(j);
    const double lat = dst_lats(j);
    if (!std::isfinite(lon) || !std::isfinite(lat)) {
      continue;
    }
    const Eigen::Vector3d q = to_cartesian(lon, lat, config_.earth_radius_m);
    const CellIndex c = cell_of(q, radius);

    double best_sq = radius_sq;
    Eigen::Index best = -1;
    for (std::int64_t dx = -1; dx <= 1; ++dx) {
      for (std::int64_t dy = -1; dy <= 1; ++dy) {
        for (std::int64_t dz = -1; dz <= 1; ++dz) {
          const auto it = cells.find(CellIndex{.x = c.x + dx, .y = c.y + dy, .z = c.z + dz}.key());
          if (it == cells.end()) {
            continue;
          }
          for (const Eigen::Index i : it->second) {
            const double d_sq = (points[static_cast<std::size_t>(i)] - q).squaredNorm();
            // Ties keep the lowest source index.
            if (d_sq < best_sq || (d_sq == best_sq && (best < 0 || i < best))) {
              best_sq = d_sq;
              best = i;
            }
          }
        }
      }
    }
    if (best >= 0) {
      out.data(j) = src(best);
    }
  }
  return out;
}

}  // namespace geoproxyvis::regrid
