/**
 * @file math_utils.hpp
 * @brief 3x3 rotation helpers used by the frame transforms.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cmath>
#include <cstddef>

#include "solargen/core/constants.hpp"
#include "solargen/core/types.hpp"

namespace solargen::core {

/**
 * @brief Dense 3x3 matrix in row-major storage.
 */
struct Mat3 {
  std::array<double, 9> v{};
  [[nodiscard]] double& operator()(const int r, const int c) { return v[static_cast<std::size_t>(r * 3 + c)]; }
  [[nodiscard]] double operator()(const int r, const int c) const { return v[static_cast<std::size_t>(r * 3 + c)]; }
};

inline Mat3 mat_identity() {
  Mat3 m{};
  m(0, 0) = 1.0;
  m(1, 1) = 1.0;
  m(2, 2) = 1.0;
  return m;
}

/**
 * @brief Build a matrix whose rows are the given vectors.
 */
inline Mat3 mat_from_rows(const Vec3& r0, const Vec3& r1, const Vec3& r2) {
  return Mat3{{r0.x, r0.y, r0.z, r1.x, r1.y, r1.z, r2.x, r2.y, r2.z}};
}

inline Mat3 mat_mul(const Mat3& a, const Mat3& b) {
  Mat3 c{};
  for (int r = 0; r < 3; ++r) {
    for (int col = 0; col < 3; ++col) {
      c(r, col) = a(r, 0) * b(0, col) + a(r, 1) * b(1, col) + a(r, 2) * b(2, col);
    }
  }
  return c;
}

inline Mat3 mat_transpose(const Mat3& m) {
  Mat3 t{};
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      t(r, c) = m(c, r);
    }
  }
  return t;
}

inline Vec3 mat_vec(const Mat3& m, const Vec3& x) {
  return Vec3{
      m(0, 0) * x.x + m(0, 1) * x.y + m(0, 2) * x.z,
      m(1, 0) * x.x + m(1, 1) * x.y + m(1, 2) * x.z,
      m(2, 0) * x.x + m(2, 1) * x.y + m(2, 2) * x.z,
  };
}

/**
 * @brief Wrap an angle into [0, 2*pi).
 */
inline double wrap_two_pi(const double a) {
  double out = std::fmod(a, constants::kTwoPi);
  if (out < 0.0) {
    out += constants::kTwoPi;
  }
  return out;
}

}  // namespace solargen::core
