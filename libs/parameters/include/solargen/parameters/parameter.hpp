/**
 * @file parameter.hpp
 * @brief Time -> scalar parameter contract shared with the host evaluation loop.
 * @author Watosn
 */
#pragma once

#include <memory>

#include "solargen/core/calendar.hpp"
#include "solargen/core/interfaces.hpp"
#include "solargen/core/types.hpp"

namespace solargen::parameters {

/**
 * @brief One host timestep.
 *
 * `hour` follows the hour-ending convention 1..24: the hour that finishes at
 * the timestamp, so 00:00 belongs to hour 24 of the previous day.
 */
struct Timestep {
  solargen::core::Epoch epoch{};
  int index{};
  int hour{24};
};

/**
 * @brief Build a timestep from an epoch, deriving the hour-ending hour of day.
 */
inline Timestep make_timestep(const solargen::core::Epoch& epoch, const int index) {
  const int civil_hour = solargen::core::calendar::utc_seconds_to_civil(epoch.utc_seconds).hour;
  return Timestep{.epoch = epoch, .index = index, .hour = civil_hour == 0 ? 24 : civil_hour};
}

/**
 * @brief Scalar parameter output with `status` set.
 */
struct ParameterValue {
  double value{};
  solargen::core::Status status{solargen::core::Status::Ok};
};

/**
 * @brief Shared resources handed to parameters before the timestep loop.
 */
struct SetupContext {
  std::shared_ptr<const solargen::core::ISunEphemeris> sun_ephemeris{};
};

/**
 * @brief Interface for host-evaluated parameters.
 */
class IParameter {
 public:
  virtual ~IParameter() = default;
  /**
   * @brief Acquire resources needed by `value()`; called once before the first timestep.
   */
  [[nodiscard]] virtual solargen::core::Status setup(const SetupContext& /*context*/) { return solargen::core::Status::Ok; }
  /**
   * @brief Evaluate the parameter for one timestep and scenario.
   */
  [[nodiscard]] virtual ParameterValue value(const Timestep& timestep, int scenario_index) const = 0;
};

}  // namespace solargen::parameters
