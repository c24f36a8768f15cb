/**
 * @file test_topocentric.cpp
 * @brief Horizontal coordinate, refraction and observer session tests.
 * @author Watosn
 */

#include <cmath>
#include <memory>

#include <spdlog/spdlog.h>

#include "solargen/core/constants.hpp"
#include "solargen/core/transforms.hpp"
#include "solargen/ephemeris/refraction.hpp"
#include "solargen/ephemeris/topocentric_session.hpp"

namespace {

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

using solargen::core::Epoch;
using solargen::core::GeodeticPoint;
using solargen::core::Status;
using solargen::core::Vec3;

// Places the Sun one astronomical unit along a fixed ITRF direction seen from a site.
class ItrfPinnedSun final : public solargen::core::ISunEphemeris {
 public:
  ItrfPinnedSun(const GeodeticPoint& site, const Vec3& enu_direction, const solargen::core::EarthOrientation& eop)
      : site_(site), enu_direction_(enu_direction), eop_(eop) {}

  [[nodiscard]] bool ready() const override { return true; }

  [[nodiscard]] solargen::core::SunVectorSample sun_geocentric(const Epoch& epoch) const override {
    const auto enu_to_itrf = solargen::core::mat_transpose(solargen::core::itrf_to_enu_rotation(site_));
    const Vec3 target_itrf = solargen::core::geodetic_to_itrf(site_) +
                             solargen::core::constants::kAstronomicalUnitM * solargen::core::mat_vec(enu_to_itrf, enu_direction_);
    const auto r = solargen::core::gcrf_to_itrf_rotation(solargen::core::time_scales(epoch, eop_.dut1_s), eop_);
    return solargen::core::SunVectorSample{.position_gcrf_m = solargen::core::mat_vec(solargen::core::mat_transpose(r), target_itrf),
                                           .status = Status::Ok};
  }

 private:
  GeodeticPoint site_{};
  Vec3 enu_direction_{};
  solargen::core::EarthOrientation eop_{};
};

class OfflineSun final : public solargen::core::ISunEphemeris {
 public:
  [[nodiscard]] bool ready() const override { return false; }
  [[nodiscard]] solargen::core::SunVectorSample sun_geocentric(const Epoch& /*epoch*/) const override {
    return solargen::core::SunVectorSample{.status = Status::DataUnavailable};
  }
};

}  // namespace

int main() {
  namespace c = solargen::core::constants;
  using solargen::ephemeris::horizontal_from_itrf;

  const GeodeticPoint equator{.lat_deg = 0.0, .lon_deg = 0.0, .alt_m = 0.0};
  const auto site_itrf = solargen::core::geodetic_to_itrf(equator);
  const auto enu = solargen::core::itrf_to_enu_rotation(equator);

  const auto zenith = horizontal_from_itrf(site_itrf + Vec3{1.0e6, 0.0, 0.0}, site_itrf, enu);
  if (zenith.status != Status::Ok || !approx_abs(zenith.altitude_rad, c::kHalfPi, 1e-12) ||
      !approx_abs(zenith.distance_m, 1.0e6, 1e-6)) {
    spdlog::error("zenith target mismatch");
    return 1;
  }
  const auto north = horizontal_from_itrf(site_itrf + Vec3{0.0, 0.0, 1.0e6}, site_itrf, enu);
  const auto east = horizontal_from_itrf(site_itrf + Vec3{0.0, 1.0e6, 0.0}, site_itrf, enu);
  const auto west = horizontal_from_itrf(site_itrf + Vec3{0.0, -1.0e6, 0.0}, site_itrf, enu);
  if (!approx_abs(north.altitude_rad, 0.0, 1e-12) || !(north.azimuth_rad < 1e-12 || north.azimuth_rad > c::kTwoPi - 1e-12) ||
      !approx_abs(east.azimuth_rad, c::kHalfPi, 1e-12) || !approx_abs(west.azimuth_rad, 1.5 * c::kPi, 1e-12)) {
    spdlog::error("horizon azimuths mismatch: n={} e={} w={}", north.azimuth_rad, east.azimuth_rad, west.azimuth_rad);
    return 2;
  }
  if (horizontal_from_itrf(site_itrf, site_itrf, enu).status != Status::NumericalError) {
    spdlog::error("zero range should be a numerical error");
    return 3;
  }

  const solargen::ephemeris::RefractionOptions off{};
  const solargen::ephemeris::RefractionOptions on{.enabled = true};
  if (solargen::ephemeris::refraction_correction_rad(0.0, off) != 0.0) {
    spdlog::error("refraction applied while disabled");
    return 4;
  }
  // Standard atmosphere lifts the horizon by roughly half a degree, and almost nothing near zenith.
  const double horizon_lift_deg = solargen::ephemeris::refraction_correction_rad(0.0, on) * c::kRadToDeg;
  const double zenith_lift_deg = solargen::ephemeris::refraction_correction_rad(80.0 * c::kDegToRad, on) * c::kRadToDeg;
  if (!(horizon_lift_deg > 0.45 && horizon_lift_deg < 0.6) || !(zenith_lift_deg > 0.0 && zenith_lift_deg < 0.01)) {
    spdlog::error("refraction magnitude mismatch: horizon={} high={}", horizon_lift_deg, zenith_lift_deg);
    return 5;
  }
  if (solargen::ephemeris::refraction_correction_rad(-5.0 * c::kDegToRad, on) != 0.0) {
    spdlog::error("refraction applied well below horizon");
    return 6;
  }

  const GeodeticPoint site{.lat_deg = 40.0, .lon_deg = -105.0, .alt_m = 1600.0};
  const solargen::ephemeris::TopocentricSunSession::Options options{
      .eop = {.xp_rad = 0.1 * c::kArcsecToRad, .yp_rad = 0.3 * c::kArcsecToRad, .dut1_s = -0.1},
  };
  const Epoch epoch{1718971200.0};  // 2024-06-21T12:00:00Z

  const solargen::ephemeris::TopocentricSunSession overhead(
      site, std::make_shared<ItrfPinnedSun>(site, Vec3{0.0, 0.0, 1.0}, options.eop), options);
  const auto up = overhead.apparent_altaz(epoch);
  if (up.status != Status::Ok || !approx_abs(up.altitude_rad, c::kHalfPi, 1e-6) ||
      !approx_abs(up.distance_m, c::kAstronomicalUnitM, 1.0)) {
    spdlog::error("session overhead mismatch: alt={}", up.altitude_rad);
    return 7;
  }

  const double alt = 20.0 * c::kDegToRad;
  const double az = 250.0 * c::kDegToRad;
  const Vec3 dir{std::cos(alt) * std::sin(az), std::cos(alt) * std::cos(az), std::sin(alt)};
  const solargen::ephemeris::TopocentricSunSession slanted(site, std::make_shared<ItrfPinnedSun>(site, dir, options.eop), options);
  const auto s = slanted.apparent_altaz(epoch);
  if (s.status != Status::Ok || !approx_abs(s.altitude_rad, alt, 1e-9) || !approx_abs(s.azimuth_rad, az, 1e-9)) {
    spdlog::error("session slanted mismatch: alt={} az={}", s.altitude_rad, s.azimuth_rad);
    return 8;
  }

  auto refracted_options = options;
  refracted_options.refraction.enabled = true;
  const solargen::ephemeris::TopocentricSunSession refracted(site, std::make_shared<ItrfPinnedSun>(site, dir, options.eop),
                                                            refracted_options);
  const auto sr = refracted.apparent_altaz(epoch);
  if (sr.status != Status::Ok || !(sr.altitude_rad > s.altitude_rad) || !approx_abs(sr.azimuth_rad, s.azimuth_rad, 1e-12)) {
    spdlog::error("refracted session should only raise altitude");
    return 9;
  }

  const solargen::ephemeris::TopocentricSunSession offline(site, std::make_shared<OfflineSun>(), options);
  const solargen::ephemeris::TopocentricSunSession unbound(site, nullptr, options);
  if (offline.apparent_altaz(epoch).status != Status::DataUnavailable ||
      unbound.apparent_altaz(epoch).status != Status::DataUnavailable) {
    spdlog::error("missing ephemeris should report data unavailable");
    return 10;
  }

  return 0;
}
