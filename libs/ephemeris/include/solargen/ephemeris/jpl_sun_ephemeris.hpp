/**
 * @file jpl_sun_ephemeris.hpp
 * @brief Geocentric Sun vectors from a JPL DE binary ephemeris.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <utility>

#include "solargen/core/interfaces.hpp"

namespace jpl::eph {
class Ephemeris;
class Workspace;
}  // namespace jpl::eph

namespace solargen::ephemeris {

/**
 * @brief Sun ephemeris backed by a JPL DE file (DE421/DE440 and friends).
 *
 * One instance may be shared by any number of observer sessions.
 */
class JplSunEphemeris final : public solargen::core::ISunEphemeris {
 public:
  /**
   * @brief Configuration for ephemeris construction.
   */
  struct Config {
    std::filesystem::path ephemeris_file{};
    bool light_time{true};
  };

  /**
   * @brief Factory helper that loads the ephemeris file.
   *
   * Always returns an object; `ready()` is false when the file could not be opened.
   */
  static std::unique_ptr<JplSunEphemeris> Create(const Config& config);

  [[nodiscard]] bool ready() const override { return static_cast<bool>(ephemeris_); }

  /**
   * @brief Apparent geocentric Sun vector in GCRF.
   *
   * With `light_time` the Sun-Earth vector is taken at `t - r/c`, which folds
   * light time and annual aberration together to first order.
   */
  [[nodiscard]] solargen::core::SunVectorSample sun_geocentric(const solargen::core::Epoch& epoch) const override;

 private:
  explicit JplSunEphemeris(Config config) : config_(std::move(config)) {}

  Config config_{};
  std::shared_ptr<jpl::eph::Ephemeris> ephemeris_{};
};

}  // namespace solargen::ephemeris
