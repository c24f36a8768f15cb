/**
 * @file constant_parameter.hpp
 * @brief Constant-value parameter.
 * @author Watosn
 */
#pragma once

#include "solargen/parameters/parameter.hpp"

namespace solargen::parameters {

/**
 * @brief Fixed value for every timestep and scenario; usable directly as a value source.
 */
class ConstantParameter final : public IParameter, public solargen::core::IValueSource {
 public:
  explicit ConstantParameter(const double value) : value_(value) {}

  [[nodiscard]] ParameterValue value(const Timestep& /*timestep*/, int /*scenario_index*/) const override {
    return ParameterValue{.value = value_, .status = solargen::core::Status::Ok};
  }

  [[nodiscard]] double get_value(int /*scenario_index*/) const override { return value_; }

 private:
  double value_{};
};

}  // namespace solargen::parameters
