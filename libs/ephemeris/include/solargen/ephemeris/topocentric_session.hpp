/**
 * @file topocentric_session.hpp
 * @brief Observer-bound apparent sun position (alt/az) from a shared ephemeris.
 * @author Watosn
 */
#pragma once

#include <memory>

#include "solargen/core/interfaces.hpp"
#include "solargen/core/math_utils.hpp"
#include "solargen/ephemeris/refraction.hpp"

namespace solargen::ephemeris {

/**
 * @brief Convert an ITRF target position to horizontal coordinates seen from a site.
 * @param target_itrf_m Target position, Earth-fixed.
 * @param site_itrf_m Observer position, Earth-fixed.
 * @param itrf_to_enu Local East/North/Up rotation at the observer.
 */
[[nodiscard]] solargen::core::HorizontalCoordinates horizontal_from_itrf(const solargen::core::Vec3& target_itrf_m,
                                                                         const solargen::core::Vec3& site_itrf_m,
                                                                         const solargen::core::Mat3& itrf_to_enu);

/**
 * @brief Binding of one observer site to a Sun ephemeris.
 *
 * Built once at setup and reused for every query. Not safe for concurrent
 * queries when the underlying ephemeris is not.
 */
class TopocentricSunSession final : public solargen::core::ISolarPositionProvider {
 public:
  /**
   * @brief Earth orientation and refraction options.
   */
  struct Options {
    solargen::core::EarthOrientation eop{};
    RefractionOptions refraction{};
  };

  TopocentricSunSession(solargen::core::GeodeticPoint site,
                        std::shared_ptr<const solargen::core::ISunEphemeris> ephemeris,
                        Options options);

  /**
   * @brief Apparent alt/az of the Sun: GCRF->ITRF, parallax, ENU projection, optional refraction.
   */
  [[nodiscard]] solargen::core::HorizontalCoordinates apparent_altaz(const solargen::core::Epoch& epoch) const override;

  [[nodiscard]] const solargen::core::GeodeticPoint& site() const noexcept { return site_; }

 private:
  solargen::core::GeodeticPoint site_{};
  solargen::core::Vec3 site_itrf_m_{};
  solargen::core::Mat3 itrf_to_enu_{};
  std::shared_ptr<const solargen::core::ISunEphemeris> ephemeris_{};
  Options options_{};
};

}  // namespace solargen::ephemeris
