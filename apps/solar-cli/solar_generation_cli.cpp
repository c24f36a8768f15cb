/**
 * @file solar_generation_cli.cpp
 * @brief Single-timestamp collector power CLI.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <memory>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "solargen/core/calendar.hpp"
#include "solargen/core/constants.hpp"
#include "solargen/ephemeris/jpl_sun_ephemeris.hpp"
#include "solargen/ephemeris/topocentric_session.hpp"
#include "solargen/parameters/constant_parameter.hpp"
#include "solargen/parameters/solar_generation.hpp"

int main(int argc, char** argv) {
  if (argc < 9 || argc > 11) {
    spdlog::error(
        "usage: solar_generation_cli <utc_iso8601> <lat_deg> <lon_deg> <elevation_m> <collector_azimuth_rad> "
        "<collector_tilt_rad> <collector_area_m2> <jpl_ephemeris_file> [direct_radiation] [diffuse_radiation]");
    return 1;
  }

  const auto epoch = solargen::core::calendar::parse_iso8601(argv[1]);
  if (!epoch.has_value()) {
    spdlog::error("invalid timestamp: {}", argv[1]);
    return 1;
  }

  const std::filesystem::path eph_file = argv[8];
  if (!std::filesystem::exists(eph_file)) {
    spdlog::error("ephemeris file not found: {}", eph_file.string());
    return 2;
  }

  const double direct = (argc >= 10) ? std::atof(argv[9]) : 1000.0;
  const double diffuse = (argc >= 11) ? std::atof(argv[10]) : 100.0;

  const solargen::core::GeodeticPoint site{.lat_deg = std::atof(argv[2]), .lon_deg = std::atof(argv[3]), .alt_m = std::atof(argv[4])};

  solargen::core::Status status = solargen::core::Status::Ok;
  auto collector = solargen::parameters::SolarGenerationParameter::Create(
      {.position = site,
       .collector_azimuth_rad = std::atof(argv[5]),
       .collector_tilt_rad = std::atof(argv[6]),
       .collector_area_m2 = std::atof(argv[7]),
       .direct_radiation = std::make_shared<solargen::parameters::ConstantParameter>(direct),
       .diffuse_radiation = std::make_shared<solargen::parameters::ConstantParameter>(diffuse)},
      &status);
  if (!collector) {
    spdlog::error("invalid collector configuration: {}", solargen::core::to_string(status));
    return 3;
  }

  std::shared_ptr<const solargen::core::ISunEphemeris> ephemeris =
      solargen::ephemeris::JplSunEphemeris::Create({.ephemeris_file = eph_file});
  status = collector->setup({.sun_ephemeris = ephemeris});
  if (status != solargen::core::Status::Ok) {
    spdlog::error("setup failed: {}", solargen::core::to_string(status));
    return 4;
  }

  const solargen::ephemeris::TopocentricSunSession session(site, ephemeris, {});
  const auto sun = session.apparent_altaz(*epoch);
  const auto timestep = solargen::parameters::make_timestep(*epoch, 0);
  const auto out = collector->value(timestep, 0);
  if (sun.status != solargen::core::Status::Ok || out.status != solargen::core::Status::Ok) {
    spdlog::error("evaluation failed: sun={} power={}", solargen::core::to_string(sun.status),
                  solargen::core::to_string(out.status));
    return 5;
  }

  namespace c = solargen::core::constants;
  fmt::print("utc={} alt_deg={:.6f} az_deg={:.6f} sun_distance_m={:.6e}\n", solargen::core::calendar::format_iso8601(*epoch),
             sun.altitude_rad * c::kRadToDeg, sun.azimuth_rad * c::kRadToDeg, sun.distance_m);
  fmt::print("direct={} diffuse={} power={:.6f}\n", direct, diffuse, out.value);
  return 0;
}
