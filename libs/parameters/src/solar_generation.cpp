/**
 * @file solar_generation.cpp
 * @brief Fixed-orientation PV collector power implementation.
 * @author Watosn
 */

#include "solargen/parameters/solar_generation.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

#include "solargen/core/constants.hpp"
#include "solargen/ephemeris/jpl_sun_ephemeris.hpp"

namespace solargen::parameters {
namespace {

double source_value(const std::shared_ptr<const solargen::core::IValueSource>& source, const int scenario_index) {
  return source ? source->get_value(scenario_index) : 0.0;
}

}  // namespace

double incidence_factor(const double altitude_rad, const double azimuth_rad, const double collector_azimuth_rad,
                        const double collector_tilt_rad) {
  const double f = std::cos(altitude_rad) * std::cos(azimuth_rad - collector_azimuth_rad) * std::sin(collector_tilt_rad) +
                   std::sin(altitude_rad) * std::cos(collector_tilt_rad);
  return std::max(f, 0.0);
}

double diffuse_view_factor(const double collector_tilt_rad) {
  return std::max((1.0 + std::cos(collector_tilt_rad)) / 2.0, 0.0);
}

double collector_power(const double direct_radiation, const double incidence, const double diffuse_factor,
                       const double diffuse_radiation, const double area_m2) {
  // std::max(NaN, 0.0) yields NaN: upstream anomalies are not sanitized here.
  const double direct = std::max(direct_radiation, 0.0);
  const double diffuse = std::max(diffuse_radiation, 0.0);
  return (direct * incidence + diffuse_factor * diffuse) * area_m2;
}

solargen::core::Status SolarGenerationParameter::validate(const Config& config) {
  if (!config.position.has_value()) {
    spdlog::error("solar generation: missing position");
    return solargen::core::Status::ConfigurationError;
  }
  if (!config.collector_azimuth_rad.has_value()) {
    spdlog::error("solar generation: missing collector azimuth");
    return solargen::core::Status::ConfigurationError;
  }
  if (!config.collector_tilt_rad.has_value()) {
    spdlog::error("solar generation: missing collector tilt");
    return solargen::core::Status::ConfigurationError;
  }
  if (!config.collector_area_m2.has_value()) {
    spdlog::error("solar generation: missing collector area");
    return solargen::core::Status::ConfigurationError;
  }
  const double tilt = *config.collector_tilt_rad;
  if (!(tilt >= 0.0 && tilt <= solargen::core::constants::kPi)) {
    spdlog::error("solar generation: collector tilt {} outside [0, pi]", tilt);
    return solargen::core::Status::ConfigurationError;
  }
  if (!(*config.collector_area_m2 > 0.0)) {
    spdlog::error("solar generation: collector area {} must be positive", *config.collector_area_m2);
    return solargen::core::Status::ConfigurationError;
  }
  const auto& p = *config.position;
  if (!(std::abs(p.lat_deg) <= 90.0) || !std::isfinite(p.lon_deg) || !std::isfinite(p.alt_m) ||
      !std::isfinite(*config.collector_azimuth_rad)) {
    spdlog::error("solar generation: position/azimuth not finite or latitude out of range");
    return solargen::core::Status::ConfigurationError;
  }
  return solargen::core::Status::Ok;
}

SolarGenerationParameter::SolarGenerationParameter(CollectorGeometry geometry, Config config)
    : geometry_(geometry), config_(std::move(config)) {}

std::unique_ptr<SolarGenerationParameter> SolarGenerationParameter::Create(const Config& config, solargen::core::Status* status) {
  const auto valid = validate(config);
  if (status != nullptr) {
    *status = valid;
  }
  if (valid != solargen::core::Status::Ok) {
    return nullptr;
  }
  const CollectorGeometry geometry{
      .position = *config.position,
      .azimuth_rad = *config.collector_azimuth_rad,
      .tilt_rad = *config.collector_tilt_rad,
      .area_m2 = *config.collector_area_m2,
  };
  return std::unique_ptr<SolarGenerationParameter>(new SolarGenerationParameter(geometry, config));
}

solargen::core::Status SolarGenerationParameter::setup(const SetupContext& context) {
  if (session_) {
    return solargen::core::Status::Ok;
  }

  std::shared_ptr<const solargen::core::ISunEphemeris> ephemeris = context.sun_ephemeris;
  if (!ephemeris) {
    if (config_.ephemeris_file.empty()) {
      spdlog::error("solar generation: no ephemeris supplied and no ephemeris file configured");
      return solargen::core::Status::DataUnavailable;
    }
    ephemeris = solargen::ephemeris::JplSunEphemeris::Create({.ephemeris_file = config_.ephemeris_file});
  }
  if (!ephemeris->ready()) {
    spdlog::error("solar generation: ephemeris dataset unavailable");
    return solargen::core::Status::DataUnavailable;
  }

  session_ = std::make_shared<solargen::ephemeris::TopocentricSunSession>(geometry_.position, std::move(ephemeris),
                                                                         config_.session);
  spdlog::debug("solar generation: session bound at lat={} lon={}", geometry_.position.lat_deg, geometry_.position.lon_deg);
  return solargen::core::Status::Ok;
}

solargen::core::Status SolarGenerationParameter::bind_session(std::shared_ptr<const solargen::core::ISolarPositionProvider> session) {
  if (!session) {
    return solargen::core::Status::InvalidInput;
  }
  session_ = std::move(session);
  return solargen::core::Status::Ok;
}

ParameterValue SolarGenerationParameter::value(const Timestep& timestep, const int scenario_index) const {
  if (!session_) {
    return ParameterValue{.status = solargen::core::Status::DataUnavailable};
  }
  const auto sun = session_->apparent_altaz(timestep.epoch);
  if (sun.status != solargen::core::Status::Ok) {
    return ParameterValue{.status = sun.status};
  }
  if (sun.altitude_rad < 0.0) {
    return ParameterValue{.value = 0.0, .status = solargen::core::Status::Ok};
  }

  const double incidence = incidence_factor(sun.altitude_rad, sun.azimuth_rad, geometry_.azimuth_rad, geometry_.tilt_rad);
  const double diffuse_factor = diffuse_view_factor(geometry_.tilt_rad);
  const double direct = source_value(config_.direct_radiation, scenario_index);
  const double diffuse = source_value(config_.diffuse_radiation, scenario_index);
  return ParameterValue{
      .value = collector_power(direct, incidence, diffuse_factor, diffuse, geometry_.area_m2),
      .status = solargen::core::Status::Ok,
  };
}

}  // namespace solargen::parameters
