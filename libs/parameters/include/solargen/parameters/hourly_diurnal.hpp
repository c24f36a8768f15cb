/**
 * @file hourly_diurnal.hpp
 * @brief Repeating 24-hour profile keyed by hour of day.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <vector>

#include "solargen/parameters/parameter.hpp"

namespace solargen::parameters {

/**
 * @brief Diurnal lookup: hour `h` (1..24, hour ending) maps to `table[h - 1]`.
 */
class HourlyDiurnalParameter final : public IParameter {
 public:
  static constexpr std::size_t kHoursPerDay = 24;
  using Table = std::array<double, kHoursPerDay>;

  explicit HourlyDiurnalParameter(const Table& values) : values_(values) {}

  /**
   * @brief Factory helper from a runtime sequence; `ConfigurationError` unless it holds exactly 24 values.
   */
  static std::unique_ptr<HourlyDiurnalParameter> Create(const std::vector<double>& values,
                                                        solargen::core::Status* status = nullptr);

  [[nodiscard]] ParameterValue value(const Timestep& timestep, int scenario_index) const override;

  /**
   * @brief Table entry for an hour-ending hour; `OutOfRange` outside [1, 24].
   */
  [[nodiscard]] ParameterValue value_at_hour(int hour) const;

  [[nodiscard]] const Table& values() const noexcept { return values_; }

 private:
  Table values_{};
};

}  // namespace solargen::parameters
