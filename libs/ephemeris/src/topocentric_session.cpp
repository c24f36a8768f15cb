/**
 * @file topocentric_session.cpp
 * @brief Observer-bound apparent sun position implementation.
 * @author Watosn
 */

#include "solargen/ephemeris/topocentric_session.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "solargen/core/transforms.hpp"

namespace solargen::ephemeris {

solargen::core::HorizontalCoordinates horizontal_from_itrf(const solargen::core::Vec3& target_itrf_m,
                                                           const solargen::core::Vec3& site_itrf_m,
                                                           const solargen::core::Mat3& itrf_to_enu) {
  const auto rho_itrf = target_itrf_m - site_itrf_m;
  const double range_m = solargen::core::norm(rho_itrf);
  if (!(range_m > 0.0)) {
    return solargen::core::HorizontalCoordinates{.status = solargen::core::Status::NumericalError};
  }
  const auto enu = solargen::core::mat_vec(itrf_to_enu, rho_itrf);
  return solargen::core::HorizontalCoordinates{
      .altitude_rad = std::asin(std::clamp(enu.z / range_m, -1.0, 1.0)),
      .azimuth_rad = solargen::core::wrap_two_pi(std::atan2(enu.x, enu.y)),
      .distance_m = range_m,
      .status = solargen::core::Status::Ok,
  };
}

TopocentricSunSession::TopocentricSunSession(solargen::core::GeodeticPoint site,
                                             std::shared_ptr<const solargen::core::ISunEphemeris> ephemeris,
                                             Options options)
    : site_(site),
      site_itrf_m_(solargen::core::geodetic_to_itrf(site)),
      itrf_to_enu_(solargen::core::itrf_to_enu_rotation(site)),
      ephemeris_(std::move(ephemeris)),
      options_(options) {}

solargen::core::HorizontalCoordinates TopocentricSunSession::apparent_altaz(const solargen::core::Epoch& epoch) const {
  if (!ephemeris_ || !ephemeris_->ready()) {
    return solargen::core::HorizontalCoordinates{.status = solargen::core::Status::DataUnavailable};
  }
  const auto sun = ephemeris_->sun_geocentric(epoch);
  if (sun.status != solargen::core::Status::Ok) {
    return solargen::core::HorizontalCoordinates{.status = sun.status};
  }

  const auto ts = solargen::core::time_scales(epoch, options_.eop.dut1_s);
  const auto r_sun_itrf_m = solargen::core::mat_vec(solargen::core::gcrf_to_itrf_rotation(ts, options_.eop), sun.position_gcrf_m);
  auto out = horizontal_from_itrf(r_sun_itrf_m, site_itrf_m_, itrf_to_enu_);
  if (out.status != solargen::core::Status::Ok) {
    return out;
  }
  out.altitude_rad += refraction_correction_rad(out.altitude_rad, options_.refraction);
  return out;
}

}  // namespace solargen::ephemeris
