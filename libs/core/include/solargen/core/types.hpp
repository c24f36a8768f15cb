/**
 * @file types.hpp
 * @brief Core domain types for solargen.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <string_view>

namespace solargen::core {

/**
 * @brief Standard status code used by model outputs.
 *
 * `ConfigurationError` marks missing or invalid construction inputs,
 * `DataUnavailable` a resource (ephemeris, table) that could not be loaded,
 * `OutOfRange` a query outside the domain of a lookup.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, ConfigurationError, DataUnavailable, OutOfRange, NumericalError };

/**
 * @brief Human-readable status name for logs and CLI output.
 */
inline std::string_view to_string(const Status status) {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::ConfigurationError:
      return "configuration_error";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::OutOfRange:
      return "out_of_range";
    case Status::NumericalError:
      return "numerical_error";
  }
  return "unknown";
}

/**
 * @brief Cartesian 3-vector.
 */
struct Vec3 {
  double x{};
  double y{};
  double z{};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return Vec3{a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(double s, const Vec3& v) { return Vec3{s * v.x, s * v.y, s * v.z}; }
inline Vec3 operator*(const Vec3& v, double s) { return s * v; }
inline Vec3 operator/(const Vec3& v, double s) { return Vec3{v.x / s, v.y / s, v.z / s}; }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double norm(const Vec3& v) { return std::sqrt(dot(v, v)); }

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 *
 * Host timestamps are naive wall-clock values; they are read as UTC.
 */
struct Epoch {
  double utc_seconds{};
};

/**
 * @brief Geodetic observer position on the WGS84 ellipsoid.
 */
struct GeodeticPoint {
  double lat_deg{};
  double lon_deg{};
  double alt_m{};
};

/**
 * @brief Earth orientation parameters at an epoch.
 */
struct EarthOrientation {
  double xp_rad{};
  double yp_rad{};
  double dut1_s{};
};

/**
 * @brief Celestial Intermediate Pole state (X,Y,s).
 */
struct CelestialIntermediatePole {
  double x_rad{};
  double y_rad{};
  double s_rad{};
};

/**
 * @brief Geocentric Sun vector in GCRF.
 */
struct SunVectorSample {
  Vec3 position_gcrf_m{};
  Status status{Status::Ok};
};

/**
 * @brief Apparent topocentric horizontal coordinates.
 *
 * Azimuth is measured from north through east in [0, 2*pi).
 */
struct HorizontalCoordinates {
  double altitude_rad{};
  double azimuth_rad{};
  double distance_m{};
  Status status{Status::Ok};
};

}  // namespace solargen::core
