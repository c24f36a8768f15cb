/**
 * @file solar_generation.hpp
 * @brief Fixed-orientation PV collector power from apparent sun position and radiation inputs.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "solargen/ephemeris/topocentric_session.hpp"
#include "solargen/parameters/parameter.hpp"

namespace solargen::parameters {

/**
 * @brief Cosine of the angle between the sun ray and the collector normal, clamped at zero.
 */
[[nodiscard]] double incidence_factor(double altitude_rad, double azimuth_rad, double collector_azimuth_rad,
                                      double collector_tilt_rad);

/**
 * @brief Isotropic-sky diffuse view factor `(1 + cos(tilt)) / 2`, clamped at zero.
 */
[[nodiscard]] double diffuse_view_factor(double collector_tilt_rad);

/**
 * @brief Combine radiation terms into collector power.
 *
 * Radiation inputs are clamped at zero; NaN passes through the clamp.
 */
[[nodiscard]] double collector_power(double direct_radiation, double incidence, double diffuse_factor,
                                     double diffuse_radiation, double area_m2);

/**
 * @brief Power output of a fixed-tilt, fixed-azimuth solar collector.
 *
 * Two-phase lifecycle: `Create` validates geometry, `setup` binds the
 * ephemeris session that every later `value()` reuses.
 */
class SolarGenerationParameter final : public IParameter {
 public:
  /**
   * @brief Immutable collector geometry.
   */
  struct CollectorGeometry {
    solargen::core::GeodeticPoint position{};
    double azimuth_rad{};
    double tilt_rad{};
    double area_m2{};
  };

  /**
   * @brief Configuration for collector construction.
   *
   * Geometry members are optional so that missing inputs are reported rather than defaulted.
   */
  struct Config {
    std::optional<solargen::core::GeodeticPoint> position{};
    std::optional<double> collector_azimuth_rad{};
    std::optional<double> collector_tilt_rad{};
    std::optional<double> collector_area_m2{};
    std::shared_ptr<const solargen::core::IValueSource> direct_radiation{};
    std::shared_ptr<const solargen::core::IValueSource> diffuse_radiation{};
    std::filesystem::path ephemeris_file{};
    solargen::ephemeris::TopocentricSunSession::Options session{};
  };

  /**
   * @brief Check required geometry: position, azimuth, tilt in [0, pi], area > 0.
   */
  [[nodiscard]] static solargen::core::Status validate(const Config& config);

  /**
   * @brief Factory helper; returns null with `ConfigurationError` when `validate` fails.
   */
  static std::unique_ptr<SolarGenerationParameter> Create(const Config& config, solargen::core::Status* status = nullptr);

  /**
   * @brief Bind the ephemeris session.
   *
   * Uses `context.sun_ephemeris` when present, otherwise opens `ephemeris_file`.
   * Returns `DataUnavailable` when no dataset can be loaded. No-op once bound.
   */
  [[nodiscard]] solargen::core::Status setup(const SetupContext& context) override;

  /**
   * @brief Bind an explicit sun position provider instead of an ephemeris.
   */
  [[nodiscard]] solargen::core::Status bind_session(std::shared_ptr<const solargen::core::ISolarPositionProvider> session);

  /**
   * @brief Collector power for the timestep; exactly zero when the Sun is below the horizon.
   */
  [[nodiscard]] ParameterValue value(const Timestep& timestep, int scenario_index) const override;

  [[nodiscard]] bool is_setup() const noexcept { return static_cast<bool>(session_); }
  [[nodiscard]] const CollectorGeometry& geometry() const noexcept { return geometry_; }

 private:
  SolarGenerationParameter(CollectorGeometry geometry, Config config);

  CollectorGeometry geometry_{};
  Config config_{};
  std::shared_ptr<const solargen::core::ISolarPositionProvider> session_{};
};

}  // namespace solargen::parameters
