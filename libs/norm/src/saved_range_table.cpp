/**
 * @file saved_range_table.cpp
 * @brief Saved ProxyVis range table implementation.
 * @author Watosn
 */

#include "geoproxyvis/norm/saved_range_table.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

#include "geoproxyvis/core/satellite.hpp"

namespace geoproxyvis::norm {
namespace {

constexpr std::size_t kSatelliteCol = 0;
constexpr std::size_t kAlgorithmCol = 1;
constexpr std::size_t kMinCol = 2;
constexpr std::size_t kMaxCol = 3;
constexpr std::size_t kColumns = 4;
constexpr const char* kAnyAlgorithm = "*";

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(core::sanitize_keyword(token));
  }
  return fields;
}

bool parse_double(const std::string& text, double& value) {
  try {
    std::size_t used = 0;
    value = std::stod(text, &used);
    return used == text.size() && std::isfinite(value);
  } catch (...) {
    return false;
  }
}

}  // namespace

SavedRangeTable::SavedRangeTable(std::vector<Entry> entries) : entries_(std::move(entries)) {
  for (auto& e : entries_) {
    e.satellite = core::sanitize_keyword(e.satellite);
    e.algorithm = core::sanitize_keyword(e.algorithm);
  }
}

std::unique_ptr<SavedRangeTable> SavedRangeTable::Create(const Config& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    return std::make_unique<SavedRangeTable>(std::vector<Entry>{});
  }

  std::vector<Entry> entries;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto fields = split_csv_line(line);
    if (fields.size() < kColumns) {
      continue;
    }
    double lo = 0.0;
    double hi = 0.0;
    if (!parse_double(fields[kMinCol], lo) || !parse_double(fields[kMaxCol], hi)) {
      // Header row lands here too.
      continue;
    }
    entries.push_back(Entry{.satellite = fields[kSatelliteCol],
                            .algorithm = fields[kAlgorithmCol].empty() ? kAnyAlgorithm : fields[kAlgorithmCol],
                            .range = NormalizationRange{.min = lo, .max = hi}});
  }
  return std::make_unique<SavedRangeTable>(std::move(entries));
}

SavedRangeTable SavedRangeTable::Defaults() {
  return SavedRangeTable(std::vector<Entry>{
      {.satellite = "goes16", .algorithm = kAnyAlgorithm, .range = {.min = 0.0, .max = 0.78}},
      {.satellite = "goes17", .algorithm = kAnyAlgorithm, .range = {.min = 0.0, .max = 0.84}},
      {.satellite = "goes18", .algorithm = kAnyAlgorithm, .range = {.min = 0.0, .max = 0.84}},
      {.satellite = "himawari8", .algorithm = kAnyAlgorithm, .range = {.min = 0.0, .max = 0.79}},
      {.satellite = "himawari9", .algorithm = kAnyAlgorithm, .range = {.min = 0.0, .max = 0.79}},
      {.satellite = "meteosat-9", .algorithm = kAnyAlgorithm, .range = {.min = 0.0, .max = 0.78}},
      {.satellite = "meteosat-10", .algorithm = kAnyAlgorithm, .range = {.min = 0.0, .max = 0.78}},
      {.satellite = "meteosat-11", .algorithm = kAnyAlgorithm, .range = {.min = 0.0, .max = 0.78}},
  });
}

SavedRangeLookup SavedRangeTable::lookup(std::string_view satellite, std::string_view algorithm) const {
  const std::string sat = core::sanitize_keyword(satellite);
  const std::string alg = core::sanitize_keyword(algorithm);
  const Entry* wildcard = nullptr;
  for (const auto& e : entries_) {
    if (e.satellite != sat) {
      continue;
    }
    if (e.algorithm == alg) {
      return SavedRangeLookup{.range = e.range, .status = core::Status::Ok};
    }
    if (e.algorithm == kAnyAlgorithm && wildcard == nullptr) {
      wildcard = &e;
    }
  }
  if (wildcard != nullptr) {
    return SavedRangeLookup{.range = wildcard->range, .status = core::Status::Ok};
  }
  return SavedRangeLookup{.status = core::Status::DataUnavailable};
}

}  // namespace geoproxyvis::norm
