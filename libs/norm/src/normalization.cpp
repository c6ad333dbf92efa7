/**
 * @file normalization.cpp
 * @brief Min/max normalization implementation.
 * @author Watosn
 */

#include "geoproxyvis/norm/normalization.hpp"

#include <cmath>
#include <limits>

namespace geoproxyvis::norm {

NormalizationRange finite_range(const core::Raster& raster) {
  const core::MaskRaster finite = raster.isFinite();
  if (!finite.any()) {
    return NormalizationRange{};
  }
  constexpr double kInf = std::numeric_limits<double>::infinity();
  return NormalizationRange{.min = finite.select(raster, kInf).minCoeff(), .max = finite.select(raster, -kInf).maxCoeff()};
}

core::Raster normalize_to_unit(const core::Raster& raster, const NormalizationRange& range) {
  if (range.degenerate() || !std::isfinite(range.min) || !std::isfinite(range.max)) {
    const core::Raster mid = core::Raster::Constant(raster.rows(), raster.cols(), 0.5);
    const core::Raster nan =
        core::Raster::Constant(raster.rows(), raster.cols(), std::numeric_limits<double>::quiet_NaN());
    return raster.isFinite().select(mid, nan);
  }
  return (raster - range.min) / (range.max - range.min);
}

NormalizedRaster normalize_pvis(const core::Raster& regression, NormalizationMode mode,
                                const NormalizationRange& saved_range) {
  // A handful of full-disk pixels go negative from 3.9 um noise; they show up as black dots.
  const core::MaskRaster negative = regression < 0.0;
  const core::Raster clipped = negative.select(0.0, regression);

  const NormalizationRange range = (mode == NormalizationMode::Saved) ? saved_range : finite_range(clipped);
  const core::Raster unit = normalize_to_unit(clipped, range);
  const core::Raster floored = negative.select(0.0, unit);
  const core::Raster filled = floored.isNaN().select(range.max, floored);

  NormalizedRaster out{};
  out.values = filled.pow(kGammaCorrection);
  out.range = range;
  return out;
}

}  // namespace geoproxyvis::norm
