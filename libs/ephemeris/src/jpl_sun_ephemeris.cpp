/**
 * @file jpl_sun_ephemeris.cpp
 * @brief JPL DE Sun ephemeris implementation.
 * @author Watosn
 */

#include "solargen/ephemeris/jpl_sun_ephemeris.hpp"

#include <array>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "jpl_eph/jpl_eph.hpp"
#include "solargen/core/constants.hpp"
#include "solargen/core/transforms.hpp"

namespace solargen::ephemeris {
namespace {

solargen::core::Vec3 to_vec3(const std::array<double, 6>& pv) {
  return solargen::core::Vec3{pv[0], pv[1], pv[2]};
}

solargen::core::Status map_jpl_error(const jpl::eph::Status& s) {
  switch (s.code) {
    case jpl::eph::ErrorCode::kInvalidArgument:
      return solargen::core::Status::InvalidInput;
    case jpl::eph::ErrorCode::kIo:
    case jpl::eph::ErrorCode::kCorruptFile:
    case jpl::eph::ErrorCode::kOutOfRange:
    case jpl::eph::ErrorCode::kUnsupported:
      return solargen::core::Status::DataUnavailable;
    case jpl::eph::ErrorCode::kOk:
    default:
      return solargen::core::Status::NumericalError;
  }
}

jpl::eph::Workspace& thread_local_workspace_for(const void* key) {
  thread_local std::unordered_map<const void*, jpl::eph::Workspace> workspaces{};
  return workspaces[key];
}

}  // namespace

std::unique_ptr<JplSunEphemeris> JplSunEphemeris::Create(const Config& config) {
  auto out = std::unique_ptr<JplSunEphemeris>(new JplSunEphemeris(config));
  auto opened = jpl::eph::Ephemeris::Open(config.ephemeris_file.string());
  if (!opened.has_value()) {
    spdlog::warn("jpl ephemeris '{}' could not be opened (status={})", config.ephemeris_file.string(),
                 solargen::core::to_string(map_jpl_error(opened.error())));
    return out;
  }
  out->ephemeris_ = opened.value();
  spdlog::debug("jpl ephemeris loaded: {}", config.ephemeris_file.string());
  return out;
}

solargen::core::SunVectorSample JplSunEphemeris::sun_geocentric(const solargen::core::Epoch& epoch) const {
  if (!ephemeris_) {
    return solargen::core::SunVectorSample{.status = solargen::core::Status::DataUnavailable};
  }

  const double jd_tdb = solargen::core::utc_seconds_to_julian_date_tdb(epoch.utc_seconds);
  auto& workspace = thread_local_workspace_for(this);
  const auto sun = ephemeris_->PlephSi(jd_tdb, jpl::eph::Body::Sun, jpl::eph::Body::Earth, false, workspace);
  if (!sun.has_value()) {
    return solargen::core::SunVectorSample{.status = map_jpl_error(sun.error())};
  }
  const auto r_geometric_m = to_vec3(sun.value().pv);
  if (!config_.light_time) {
    return solargen::core::SunVectorSample{.position_gcrf_m = r_geometric_m, .status = solargen::core::Status::Ok};
  }

  const double light_time_days =
      solargen::core::norm(r_geometric_m) / solargen::core::constants::kSpeedOfLightMps / solargen::core::constants::kSecondsPerDay;
  const auto retarded = ephemeris_->PlephSi(jd_tdb - light_time_days, jpl::eph::Body::Sun, jpl::eph::Body::Earth, false, workspace);
  if (!retarded.has_value()) {
    return solargen::core::SunVectorSample{.status = map_jpl_error(retarded.error())};
  }
  return solargen::core::SunVectorSample{.position_gcrf_m = to_vec3(retarded.value().pv), .status = solargen::core::Status::Ok};
}

}  // namespace solargen::ephemeris
