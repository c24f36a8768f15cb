/**
 * @file transforms.hpp
 * @brief Shared time scale, frame and geodetic transform helpers.
 * @author Watosn
 */
#pragma once

#include <cmath>

#include "solargen/core/constants.hpp"
#include "solargen/core/leap_seconds.hpp"
#include "solargen/core/math_utils.hpp"
#include "solargen/core/sofa_utils.hpp"
#include "solargen/core/types.hpp"

namespace solargen::core {

/**
 * @brief Julian dates of one UTC instant in the scales the transforms need.
 */
struct TimeScales {
  double jd_utc{};
  double jd_ut1{};
  double jd_tt{};
  double jd_tdb{};
};

/**
 * @brief Convert UTC seconds since Unix epoch to JD UTC.
 */
inline double utc_seconds_to_julian_date_utc(double utc_seconds) {
  return utc_seconds / constants::kSecondsPerDay + constants::kUnixEpochJd;
}

inline double tt_minus_utc_seconds(const double utc_seconds) {
  return leap_seconds::tai_minus_utc_seconds(utc_seconds) + constants::kTtMinusTaiSeconds;
}

inline double utc_seconds_to_julian_date_tt(const double utc_seconds) {
  return utc_seconds_to_julian_date_utc(utc_seconds) + tt_minus_utc_seconds(utc_seconds) / constants::kSecondsPerDay;
}

/**
 * @brief Convert UTC seconds since Unix epoch to JD TDB.
 */
inline double utc_seconds_to_julian_date_tdb(const double utc_seconds) {
  const double jd_tt = utc_seconds_to_julian_date_tt(utc_seconds);
  return jd_tt + sofa::dtdb_seconds_approx(jd_tt) / constants::kSecondsPerDay;
}

/**
 * @brief Anchor a UTC epoch in UTC/UT1/TT/TDB.
 * @param dut1_s UT1-UTC in seconds (zero when no EOP data is configured).
 */
inline TimeScales time_scales(const Epoch& epoch, const double dut1_s = 0.0) {
  TimeScales ts{};
  ts.jd_utc = utc_seconds_to_julian_date_utc(epoch.utc_seconds);
  ts.jd_ut1 = ts.jd_utc + dut1_s / constants::kSecondsPerDay;
  ts.jd_tt = utc_seconds_to_julian_date_tt(epoch.utc_seconds);
  ts.jd_tdb = ts.jd_tt + sofa::dtdb_seconds_approx(ts.jd_tt) / constants::kSecondsPerDay;
  return ts;
}

/**
 * @brief CIO-based GCRF->ITRF rotation: RPOM * R3(ERA) * RC2I.
 */
inline Mat3 gcrf_to_itrf_rotation(const TimeScales& ts, const CelestialIntermediatePole& cip, const EarthOrientation& eop) {
  const Mat3 rc2i = sofa::c2ixys(cip.x_rad, cip.y_rad, cip.s_rad);
  const Mat3 rpom = sofa::pom00(eop.xp_rad, eop.yp_rad, sofa::sp00(ts.jd_tt));
  return sofa::c2tcio(rc2i, sofa::era00(ts.jd_ut1), rpom);
}

/**
 * @brief GCRF->ITRF rotation using the truncated CIP series for `ts.jd_tt`.
 */
inline Mat3 gcrf_to_itrf_rotation(const TimeScales& ts, const EarthOrientation& eop) {
  return gcrf_to_itrf_rotation(ts, sofa::xys06_truncated(ts.jd_tt), eop);
}

/**
 * @brief WGS84 geodetic point to ITRF Cartesian position.
 */
inline Vec3 geodetic_to_itrf(const GeodeticPoint& p) {
  const double lat = p.lat_deg * constants::kDegToRad;
  const double lon = p.lon_deg * constants::kDegToRad;
  const double e2 = constants::kWgs84Flattening * (2.0 - constants::kWgs84Flattening);
  const double sin_lat = std::sin(lat);
  const double n = constants::kWgs84SemiMajorAxisM / std::sqrt(1.0 - e2 * sin_lat * sin_lat);
  return Vec3{
      (n + p.alt_m) * std::cos(lat) * std::cos(lon),
      (n + p.alt_m) * std::cos(lat) * std::sin(lon),
      (n * (1.0 - e2) + p.alt_m) * sin_lat,
  };
}

/**
 * @brief Rotation taking ITRF vectors into the local East/North/Up frame at `p`.
 */
inline Mat3 itrf_to_enu_rotation(const GeodeticPoint& p) {
  const double lat = p.lat_deg * constants::kDegToRad;
  const double lon = p.lon_deg * constants::kDegToRad;
  const double sl = std::sin(lat);
  const double cl = std::cos(lat);
  const double so = std::sin(lon);
  const double co = std::cos(lon);
  return mat_from_rows(Vec3{-so, co, 0.0}, Vec3{-sl * co, -sl * so, cl}, Vec3{cl * co, cl * so, sl});
}

}  // namespace solargen::core
