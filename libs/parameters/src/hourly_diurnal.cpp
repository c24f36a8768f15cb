/**
 * @file hourly_diurnal.cpp
 * @brief Repeating 24-hour profile implementation.
 * @author Watosn
 */

#include "solargen/parameters/hourly_diurnal.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace solargen::parameters {

std::unique_ptr<HourlyDiurnalParameter> HourlyDiurnalParameter::Create(const std::vector<double>& values,
                                                                       solargen::core::Status* status) {
  if (values.size() != kHoursPerDay) {
    spdlog::error("hourly diurnal profile needs {} values, got {}", kHoursPerDay, values.size());
    if (status != nullptr) {
      *status = solargen::core::Status::ConfigurationError;
    }
    return nullptr;
  }
  Table table{};
  std::copy(values.begin(), values.end(), table.begin());
  if (status != nullptr) {
    *status = solargen::core::Status::Ok;
  }
  return std::make_unique<HourlyDiurnalParameter>(table);
}

ParameterValue HourlyDiurnalParameter::value(const Timestep& timestep, int /*scenario_index*/) const {
  return value_at_hour(timestep.hour);
}

ParameterValue HourlyDiurnalParameter::value_at_hour(const int hour) const {
  if (hour < 1 || hour > static_cast<int>(kHoursPerDay)) {
    return ParameterValue{.status = solargen::core::Status::OutOfRange};
  }
  return ParameterValue{.value = values_[static_cast<std::size_t>(hour - 1)], .status = solargen::core::Status::Ok};
}

}  // namespace solargen::parameters
