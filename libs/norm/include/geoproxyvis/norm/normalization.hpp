/**
 * @file normalization.hpp
 * @brief Min/max normalization and ProxyVis display post-processing.
 * @author Watosn
 */
#pragma once

#include <cstdint>

#include "geoproxyvis/core/types.hpp"

namespace geoproxyvis::norm {

/**
 * @brief Display gamma applied to normalized ProxyVis (Chirokova et al. 2023).
 */
inline constexpr double kGammaCorrection = 1.0 / 1.5;

/**
 * @brief Source of the normalization range.
 */
enum class NormalizationMode : std::uint8_t { Saved, Dynamic };

/**
 * @brief Closed value range used to scale a raster.
 */
struct NormalizationRange {
  double min{};
  double max{};

  [[nodiscard]] bool degenerate() const { return !(max > min); }
};

/**
 * @brief Normalized raster and the range actually applied.
 */
struct NormalizedRaster {
  core::Raster values{};
  NormalizationRange range{};
};

/**
 * @brief Min and max over finite pixels; `{0, 0}` when no pixel is finite.
 */
[[nodiscard]] NormalizationRange finite_range(const core::Raster& raster);

/**
 * @brief Scale `raster` so that `range.min` maps to 0 and `range.max` to 1.
 *
 * Values outside the range are not clipped. A degenerate range maps every
 * finite pixel to 0.5; NaN pixels stay NaN.
 */
[[nodiscard]] core::Raster normalize_to_unit(const core::Raster& raster, const NormalizationRange& range);

/**
 * @brief ProxyVis post-processing shared by all nighttime regressions.
 *
 * Negative regression values are clipped to zero, the range is either the
 * saved one or the finite min/max of the clipped field, clipped pixels end at
 * zero, NaN pixels take the range max, and the display gamma is applied.
 * @param regression Raw regression output.
 * @param mode Saved or dynamic range.
 * @param saved_range Range used when `mode` is `Saved`.
 */
[[nodiscard]] NormalizedRaster normalize_pvis(const core::Raster& regression, NormalizationMode mode,
                                              const NormalizationRange& saved_range);

}  // namespace geoproxyvis::norm
