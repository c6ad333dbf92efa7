/**
 * @file main.cpp
 * @brief GeoProxyVis composite command-line entrypoint over raw float32 rasters.
 * @author Watosn
 */

#include <algorithm>
#include <bit>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geoproxyvis/composite/compositor.hpp"
#include "geoproxyvis/core/satellite.hpp"
#include "geoproxyvis/core/transforms.hpp"
#include "geoproxyvis/norm/saved_range_table.hpp"
#include "geoproxyvis/regrid/resampler.hpp"

namespace {

using RowMajorF32 = Eigen::Array<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(token);
  }
  return fields;
}

// Rasters are row-major little-endian float32, the layout numpy's tofile() writes,
// regardless of host byte order. The swap is its own inverse.
void to_little_endian(std::vector<char>& bytes) {
  if constexpr (std::endian::native == std::endian::big) {
    for (auto it = bytes.begin(); it != bytes.end(); it += sizeof(float)) {
      std::reverse(it, it + sizeof(float));
    }
  }
}

bool parse_int(const std::string& text, int& value) {
  try {
    std::size_t used = 0;
    value = std::stoi(text, &used);
    return used == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

bool read_raster(const std::filesystem::path& path, long rows, long cols, geoproxyvis::core::Raster& out) {
  if (rows <= 0 || cols <= 0) {
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  RowMajorF32 buffer(rows, cols);
  std::vector<char> bytes(static_cast<std::size_t>(buffer.size()) * sizeof(float));
  in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (in.gcount() != static_cast<std::streamsize>(bytes.size())) {
    return false;
  }
  to_little_endian(bytes);
  std::memcpy(buffer.data(), bytes.data(), bytes.size());
  out = buffer.cast<double>();
  return true;
}

bool write_raster(const std::filesystem::path& path, const geoproxyvis::core::Raster& raster) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    return false;
  }
  const RowMajorF32 buffer = raster.cast<float>();
  std::vector<char> bytes(static_cast<std::size_t>(buffer.size()) * sizeof(float));
  std::memcpy(bytes.data(), buffer.data(), bytes.size());
  to_little_endian(bytes);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

struct Manifest {
  geoproxyvis::core::SatelliteScan scan{};
  geoproxyvis::core::ChannelDataSet data{};
};

bool load_manifest(const std::filesystem::path& path, Manifest& manifest) {
  std::ifstream in(path);
  if (!in) {
    spdlog::error("failed to open manifest: {}", path.string());
    return false;
  }
  const auto base = path.parent_path();
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto fields = split_csv_line(line);
    const std::string key = geoproxyvis::core::sanitize_keyword(fields[0]);
    if (key == "satellite" && fields.size() == 2U) {
      manifest.scan.satellite = geoproxyvis::core::sanitize_keyword(fields[1]);
    } else if (key == "start_time" && fields.size() == 2U) {
      const auto epoch = geoproxyvis::core::parse_utc_timestamp(fields[1]);
      if (!epoch) {
        spdlog::error("line {}: bad start_time '{}'", line_no, fields[1]);
        return false;
      }
      manifest.scan.scan_start = *epoch;
    } else if (key == "scan_minutes" && fields.size() == 2U) {
      if (!parse_int(fields[1], manifest.scan.scan_minutes) || manifest.scan.scan_minutes < 0) {
        spdlog::error("line {}: bad scan_minutes '{}'", line_no, fields[1]);
        return false;
      }
    } else if (key == "raster" && fields.size() == 6U) {
      const std::string kind = geoproxyvis::core::sanitize_keyword(fields[1]);
      const std::string name = fields[2];
      std::filesystem::path raster_path = fields[5];
      if (raster_path.is_relative()) {
        raster_path = base / raster_path;
      }
      geoproxyvis::core::Raster raster{};
      int rows = 0;
      int cols = 0;
      if (!parse_int(fields[3], rows) || !parse_int(fields[4], cols) || !read_raster(raster_path, rows, cols, raster)) {
        spdlog::error("line {}: failed to read {}x{} raster {}", line_no, fields[3], fields[4], raster_path.string());
        return false;
      }
      if (kind == "bt_temp") {
        manifest.data.set(geoproxyvis::core::FieldType::BtTemp, name, std::move(raster));
      } else if (kind == "radiances") {
        manifest.data.set(geoproxyvis::core::FieldType::Radiances, name, std::move(raster));
      } else if (kind == "grid" && name == "lons_2km") {
        manifest.scan.lons_2km = std::move(raster);
      } else if (kind == "grid" && name == "lats_2km") {
        manifest.scan.lats_2km = std::move(raster);
      } else if (kind == "grid" && name == "lons_05km") {
        manifest.scan.lons_05km = std::move(raster);
      } else if (kind == "grid" && name == "lats_05km") {
        manifest.scan.lats_05km = std::move(raster);
      } else {
        spdlog::warn("line {}: ignoring raster {}/{}", line_no, kind, name);
      }
    } else {
      spdlog::warn("skipping malformed manifest row {}", line_no);
    }
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3 || argc > 8) {
    spdlog::error(
        "usage: geoproxyvis_cli <manifest_csv> <output_prefix> [pvis_alg] [vis_alg] [use_saved:0|1] [output_res] "
        "[saved_range_csv]");
    spdlog::error("manifest rows: satellite,<name> | start_time,<YYYY-MM-DDTHH:MM:SSZ> | scan_minutes,<n> | "
                  "raster,<bt_temp|radiances|grid>,<name>,<rows>,<cols>,<path>");
    spdlog::error("pvis_alg: nighttime_pvis_main_two_eq | nighttime_pvis_main_one_eq | "
                  "nighttime_pvis_simple_two_eq | nighttime_pvis_simple_one_eq");
    spdlog::error("output_res: 2.0km | 0.5km | both");
    return 1;
  }

  const std::filesystem::path manifest_path = argv[1];
  const std::string output_prefix = argv[2];
  const std::string pvis_alg = (argc >= 4) ? argv[3] : std::string(geoproxyvis::pvis::kMainTwoEq);
  const std::string vis_alg = (argc >= 5) ? argv[4] : std::string(geoproxyvis::vis::kVisDispSza);
  const std::string use_saved_arg = (argc >= 6) ? argv[5] : "1";
  if (use_saved_arg != "0" && use_saved_arg != "1") {
    spdlog::error("use_saved must be 0 or 1, got '{}'", use_saved_arg);
    return 1;
  }
  const bool use_saved = use_saved_arg == "1";
  const std::string output_res = (argc >= 7) ? argv[6] : "both";
  const std::string saved_csv = (argc >= 8) ? argv[7] : "";

  Manifest manifest{};
  if (!load_manifest(manifest_path, manifest)) {
    return 2;
  }

  std::unique_ptr<geoproxyvis::norm::SavedRangeTable> table{};
  if (!saved_csv.empty()) {
    table = geoproxyvis::norm::SavedRangeTable::Create(
        geoproxyvis::norm::SavedRangeTable::Config{.csv_file = saved_csv});
    if (table->size() == 0U) {
      spdlog::warn("saved range csv {} has no usable rows", saved_csv);
    }
  } else {
    table = std::make_unique<geoproxyvis::norm::SavedRangeTable>(geoproxyvis::norm::SavedRangeTable::Defaults());
  }
  const auto resampler =
      geoproxyvis::regrid::NearestNeighborResampler::Create(geoproxyvis::regrid::NearestNeighborResampler::Config{});
  const geoproxyvis::composite::GeoProxyVisCompositor compositor(*table, *resampler);

  geoproxyvis::composite::CompositeRequest request{};
  request.scan = &manifest.scan;
  request.data = &manifest.data;
  request.pvis_algorithm = pvis_alg;
  request.vis_algorithm = vis_alg;
  request.use_saved_params = use_saved;
  request.output_resolution = output_res;

  const auto result = compositor.evaluate(request);
  if (result.status != geoproxyvis::core::Status::Ok) {
    spdlog::error("composite failed: {} ({})", geoproxyvis::core::status_to_string(result.status), result.detail);
    return 3;
  }

  fmt::print("satellite={} pvis_alg={} use_saved={} pvis_min={} pvis_max={} vis_min={} vis_max={}\n",
             manifest.scan.satellite, pvis_alg, use_saved ? 1 : 0, result.pvis_range.min, result.pvis_range.max,
             result.vis_range.min, result.vis_range.max);
  if (result.composite_2km) {
    const auto path = output_prefix + "_2km.f32";
    if (!write_raster(path, *result.composite_2km)) {
      spdlog::error("failed to write {}", path);
      return 4;
    }
    fmt::print("2km rows={} cols={} file={}\n", result.composite_2km->rows(), result.composite_2km->cols(), path);
  }
  if (result.composite_05km) {
    const auto path = output_prefix + "_05km.f32";
    if (!write_raster(path, *result.composite_05km)) {
      spdlog::error("failed to write {}", path);
      return 4;
    }
    fmt::print("05km rows={} cols={} file={}\n", result.composite_05km->rows(), result.composite_05km->cols(), path);
  }
  return 0;
}
