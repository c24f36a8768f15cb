/**
 * @file refraction.hpp
 * @brief Atmospheric refraction correction for topocentric altitude.
 * @author Watosn
 */
#pragma once

#include <cmath>

#include "solargen/core/constants.hpp"

namespace solargen::ephemeris {

/**
 * @brief Surface conditions for the refraction correction.
 */
struct RefractionOptions {
  bool enabled{false};
  double pressure_mbar{1010.0};
  double temperature_c{10.0};
};

/**
 * @brief Refraction lift to add to a geometric altitude (NREL SPA form).
 * @param altitude_rad Geometric (airless) altitude.
 * @return Correction in radians; zero when disabled or the Sun is well below the horizon.
 */
inline double refraction_correction_rad(const double altitude_rad, const RefractionOptions& options) {
  namespace c = solargen::core::constants;
  if (!options.enabled) {
    return 0.0;
  }
  const double e0_deg = altitude_rad * c::kRadToDeg;
  if (e0_deg < -(c::kSunRadiusDeg + c::kStandardHorizonRefractionDeg)) {
    return 0.0;
  }
  const double del_e_deg = (options.pressure_mbar / 1010.0) * (283.0 / (273.0 + options.temperature_c)) * 1.02 /
                           (60.0 * std::tan((e0_deg + 10.3 / (e0_deg + 5.11)) * c::kDegToRad));
  return del_e_deg * c::kDegToRad;
}

}  // namespace solargen::ephemeris
