/**
 * @file sofa_utils.hpp
 * @brief SOFA-style Earth orientation building blocks (modern C++ implementation).
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cmath>

#include "solargen/core/constants.hpp"
#include "solargen/core/math_utils.hpp"
#include "solargen/core/types.hpp"

namespace solargen::core::sofa {

inline Mat3 rot_x(const double a) {
  Mat3 m = mat_identity();
  const double c = std::cos(a);
  const double s = std::sin(a);
  m(1, 1) = c;
  m(1, 2) = s;
  m(2, 1) = -s;
  m(2, 2) = c;
  return m;
}

inline Mat3 rot_y(const double a) {
  Mat3 m = mat_identity();
  const double c = std::cos(a);
  const double s = std::sin(a);
  m(0, 0) = c;
  m(0, 2) = -s;
  m(2, 0) = s;
  m(2, 2) = c;
  return m;
}

inline Mat3 rot_z(const double a) {
  Mat3 m = mat_identity();
  const double c = std::cos(a);
  const double s = std::sin(a);
  m(0, 0) = c;
  m(0, 1) = s;
  m(1, 0) = -s;
  m(1, 1) = c;
  return m;
}

inline double julian_centuries_tt(const double jd_tt) {
  return (jd_tt - constants::kJ2000Jd) / constants::kDaysPerJulianCentury;
}

inline double arcsec_mod_turn(const double arcsec) {
  return std::fmod(arcsec, 1296000.0) * constants::kArcsecToRad;
}

// SOFA iauFaf03: mean argument of latitude of the Moon.
inline double faf03(const double t) {
  return arcsec_mod_turn(335779.526232 + t * (1739527262.8478 + t * (-12.7512 + t * (-0.001037 + t * 0.00000417))));
}

// SOFA iauFad03: mean elongation of the Moon from the Sun.
inline double fad03(const double t) {
  return arcsec_mod_turn(1072260.703692 + t * (1602961601.2090 + t * (-6.3706 + t * (0.006593 + t * -0.00003169))));
}

// SOFA iauFaom03: mean longitude of the Moon's ascending node.
inline double faom03(const double t) {
  return arcsec_mod_turn(450160.398036 + t * (-6962890.5431 + t * (7.4722 + t * (0.007702 + t * -0.00005939))));
}

// SOFA iauEra00-compatible expression.
inline double era00(const double jd_ut1) {
  return wrap_two_pi(constants::kTwoPi * (0.7790572732640 + 1.00273781191135448 * (jd_ut1 - constants::kJ2000Jd)));
}

// SOFA iauSp00-compatible linear approximation.
inline double sp00(const double jd_tt) {
  return -47e-6 * constants::kArcsecToRad * julian_centuries_tt(jd_tt);
}

// Truncated IAU 2006/2000A CIP X,Y: full polynomial part plus the four largest
// luni-solar nutation terms. Agrees with iauXys06a to ~0.1 arcsec over 1900-2100.
inline CelestialIntermediatePole xys06_truncated(const double jd_tt) {
  const double t = julian_centuries_tt(jd_tt);
  const double f = faf03(t);
  const double d = fad03(t);
  const double om = faom03(t);
  const double a1 = om;
  const double a2 = 2.0 * f - 2.0 * d + 2.0 * om;
  const double a3 = 2.0 * f + 2.0 * om;
  const double a4 = 2.0 * om;

  const double x_as = -0.016617 + t * (2004.191898 + t * (-0.4297829 + t * (-0.19861834 + t * (0.000007578 + t * 0.0000059285))));
  const double y_as = -0.006951 + t * (-0.025896 + t * (-22.4072747 + t * (0.00190059 + t * (0.001112526 + t * 0.0000001358))));
  const double x_per_uas = -6844318.44 * std::sin(a1) - 523908.04 * std::sin(a2) - 90552.22 * std::sin(a3) + 82168.76 * std::sin(a4);
  const double y_per_uas = 9205236.26 * std::cos(a1) + 573033.42 * std::cos(a2) + 97846.69 * std::cos(a3) - 89618.24 * std::cos(a4);

  CelestialIntermediatePole out{};
  out.x_rad = x_as * constants::kArcsecToRad + x_per_uas * constants::kMicroArcsecToRad;
  out.y_rad = y_as * constants::kArcsecToRad + y_per_uas * constants::kMicroArcsecToRad;
  out.s_rad = -0.5 * out.x_rad * out.y_rad + (94.0 + 3808.65 * t) * constants::kMicroArcsecToRad;
  return out;
}

// SOFA iauC2ixys-style construction.
inline Mat3 c2ixys(const double x_rad, const double y_rad, const double s_rad) {
  const double r2 = x_rad * x_rad + y_rad * y_rad;
  const double e = (r2 > 0.0) ? std::atan2(y_rad, x_rad) : 0.0;
  const double d = std::atan(std::sqrt(r2 / std::max(1e-30, 1.0 - r2)));
  return mat_mul(rot_z(-(e + s_rad)), mat_mul(rot_y(d), rot_z(e)));
}

// SOFA iauPom00-style polar-motion matrix.
inline Mat3 pom00(const double xp_rad, const double yp_rad, const double sp_rad) {
  return mat_mul(rot_z(sp_rad), mat_mul(rot_y(-xp_rad), rot_x(-yp_rad)));
}

// SOFA iauC2tcio-style final matrix: RPOM * R3(ERA) * RC2I.
inline Mat3 c2tcio(const Mat3& rc2i, const double era_rad, const Mat3& rpom) {
  return mat_mul(rpom, mat_mul(rot_z(era_rad), rc2i));
}

// Compact periodic model for TDB-TT (seconds).
inline double dtdb_seconds_approx(const double jd_tt) {
  const double t = julian_centuries_tt(jd_tt);
  const double g = (357.5277233 + 35999.05034 * t) * constants::kDegToRad;   // Mean anomaly of the Sun.
  const double l = (280.4665 + 36000.7698 * t) * constants::kDegToRad;        // Mean longitude of the Sun.
  return 0.001657 * std::sin(g) + 0.000022 * std::sin(2.0 * g) + 0.000014 * std::sin(3.0 * g) + 0.000005 * std::sin(4.0 * g)
         + 0.000005 * std::sin(l) + 0.000002 * std::sin(2.0 * l);
}

}  // namespace solargen::core::sofa
