/**
 * @file interfaces.hpp
 * @brief Core capability interfaces for value sources and sun position.
 * @author Watosn
 */
#pragma once

#include "solargen/core/types.hpp"

namespace solargen::core {

/**
 * @brief Anything that yields a scalar for the current timestep of one scenario.
 */
class IValueSource {
 public:
  virtual ~IValueSource() = default;
  /**
   * @brief Return the value for the current timestep.
   * @param scenario_index Scenario being evaluated.
   */
  [[nodiscard]] virtual double get_value(int scenario_index) const = 0;
};

/**
 * @brief Interface for planetary ephemeris datasets able to place the Sun.
 */
class ISunEphemeris {
 public:
  virtual ~ISunEphemeris() = default;
  /**
   * @brief True once the underlying dataset has been loaded.
   */
  [[nodiscard]] virtual bool ready() const = 0;
  /**
   * @brief Apparent geocentric Sun vector at a UTC epoch.
   * @return Sample with `status` set.
   */
  [[nodiscard]] virtual SunVectorSample sun_geocentric(const Epoch& epoch) const = 0;
};

/**
 * @brief Interface for observer-bound apparent sun position.
 */
class ISolarPositionProvider {
 public:
  virtual ~ISolarPositionProvider() = default;
  /**
   * @brief Apparent topocentric altitude/azimuth of the Sun.
   * @param epoch UTC epoch.
   * @return Horizontal coordinates with `status` set.
   */
  [[nodiscard]] virtual HorizontalCoordinates apparent_altaz(const Epoch& epoch) const = 0;
};

}  // namespace solargen::core
