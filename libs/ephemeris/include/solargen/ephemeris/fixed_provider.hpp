/**
 * @file fixed_provider.hpp
 * @brief Constant sun position provider.
 * @author Watosn
 */
#pragma once

#include "solargen/core/interfaces.hpp"

namespace solargen::ephemeris {

/**
 * @brief Constant alt/az provider for testing and deterministic runs.
 */
class FixedSolarPositionProvider final : public solargen::core::ISolarPositionProvider {
 public:
  FixedSolarPositionProvider(const double altitude_rad, const double azimuth_rad)
      : position_{.altitude_rad = altitude_rad, .azimuth_rad = azimuth_rad, .distance_m = 0.0, .status = solargen::core::Status::Ok} {}

  /**
   * @brief Return the fixed position for any epoch.
   */
  [[nodiscard]] solargen::core::HorizontalCoordinates apparent_altaz(const solargen::core::Epoch& /*epoch*/) const override {
    return position_;
  }

 private:
  solargen::core::HorizontalCoordinates position_{};
};

}  // namespace solargen::ephemeris
