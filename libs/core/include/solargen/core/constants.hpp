/**
 * @file constants.hpp
 * @brief Shared numeric and physical constants.
 * @author Watosn
 */
#pragma once

namespace solargen::core::constants {

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kTwoPi = 2.0 * kPi;
inline constexpr double kHalfPi = 0.5 * kPi;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPi;
inline constexpr double kArcsecToRad = kDegToRad / 3600.0;
inline constexpr double kMicroArcsecToRad = kArcsecToRad * 1.0e-6;

inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kSecondsPerHour = 3600.0;
inline constexpr double kJ2000Jd = 2451545.0;
inline constexpr double kUnixEpochJd = 2440587.5;
inline constexpr double kDaysPerJulianCentury = 36525.0;
inline constexpr double kTtMinusTaiSeconds = 32.184;

inline constexpr double kWgs84SemiMajorAxisM = 6378137.0;
inline constexpr double kWgs84Flattening = 1.0 / 298.257223563;
inline constexpr double kAstronomicalUnitM = 149597870700.0;
inline constexpr double kSpeedOfLightMps = 299792458.0;

// Apparent solar semi-diameter and standard horizon refraction, degrees.
inline constexpr double kSunRadiusDeg = 0.26667;
inline constexpr double kStandardHorizonRefractionDeg = 0.5667;

}  // namespace solargen::core::constants
