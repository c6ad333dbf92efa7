/**
 * @file sza_cli.cpp
 * @brief Solar zenith angle and day/night classification at one location.
 * @author Watosn
 */

#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geoproxyvis/core/constants.hpp"
#include "geoproxyvis/core/transforms.hpp"
#include "geoproxyvis/solar/solar_zenith.hpp"

int main(int argc, char** argv) {
  if (argc < 4 || argc > 5) {
    spdlog::error("usage: sza_cli <start_time:YYYY-MM-DDTHH:MM:SSZ> <lat_deg> <lon_deg> [scan_minutes]");
    return 1;
  }

  const auto start = geoproxyvis::core::parse_utc_timestamp(argv[1]);
  if (!start) {
    spdlog::error("bad start_time: {}", argv[1]);
    return 2;
  }
  const double lat = std::atof(argv[2]);
  const double lon = std::atof(argv[3]);
  const int scan_minutes = (argc >= 5) ? std::atoi(argv[4]) : 0;

  const auto midpoint = geoproxyvis::core::scan_midpoint(*start, scan_minutes);
  const auto sun = geoproxyvis::solar::solar_position(midpoint);
  const double sza = geoproxyvis::solar::solar_zenith_deg(midpoint, lat, lon);
  const bool night = sza > geoproxyvis::core::constants::kSzaNightThresholdDeg;

  fmt::print("epoch_utc_s={} subsolar_lat={} subsolar_lon={} eot_min={}\n", midpoint.utc_seconds, sun.subsolar_lat_deg,
             sun.subsolar_lon_deg, sun.equation_of_time_min);
  fmt::print("sza_deg={} class={}\n", sza, night ? "night" : "day");
  return 0;
}
