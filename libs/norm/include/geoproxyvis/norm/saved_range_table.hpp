/**
 * @file saved_range_table.hpp
 * @brief Saved ProxyVis normalization ranges per satellite and algorithm.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "geoproxyvis/core/types.hpp"
#include "geoproxyvis/norm/normalization.hpp"

namespace geoproxyvis::norm {

/**
 * @brief Saved range lookup with status.
 */
struct SavedRangeLookup {
  NormalizationRange range{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Read-only table of typical ProxyVis min/max values.
 *
 * Full-disk dynamic ranges vary from scan to scan and are meaningless for
 * sub-sectors; these typical values give a stable product.
 */
class SavedRangeTable final {
 public:
  /**
   * @brief One table row. `algorithm` is `*` for rows that apply to every algorithm.
   */
  struct Entry {
    std::string satellite{};
    std::string algorithm{};
    NormalizationRange range{};
  };

  /**
   * @brief CSV table configuration.
   */
  struct Config {
    std::filesystem::path csv_file{};
  };

  /**
   * @brief Factory helper that parses `satellite,algorithm,min,max` rows.
   *
   * Header, blank, `#` comment and malformed rows are skipped. An unreadable
   * file yields an empty table whose lookups report `DataUnavailable`.
   */
  static std::unique_ptr<SavedRangeTable> Create(const Config& config);

  /**
   * @brief Published ranges for all supported satellites.
   */
  static SavedRangeTable Defaults();

  explicit SavedRangeTable(std::vector<Entry> entries);

  /**
   * @brief Range for a satellite/algorithm pair; exact algorithm rows win over `*` rows.
   */
  [[nodiscard]] SavedRangeLookup lookup(std::string_view satellite, std::string_view algorithm) const;

  [[nodiscard]] std::size_t size() const { return entries_.size(); }

 private:
  std::vector<Entry> entries_{};
};

}  // namespace geoproxyvis::norm
