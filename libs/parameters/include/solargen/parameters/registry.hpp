/**
 * @file registry.hpp
 * @brief Parameter type registry: type name -> loader from a declarative definition.
 * @author Watosn
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "solargen/parameters/parameter.hpp"
#include "solargen/parameters/parameter_file.hpp"

namespace solargen::parameters {

class ParameterModel;

/**
 * @brief Loader output with `status` set.
 */
struct LoadResult {
  std::shared_ptr<IParameter> parameter{};
  solargen::core::Status status{solargen::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Builds one parameter from its definition; references resolve against `model`.
 */
using ParameterLoader = std::function<LoadResult(const ParameterDefinition& definition, const ParameterModel& model)>;

/**
 * @brief Registry of parameter types available to parameter files.
 */
class ParameterRegistry final {
 public:
  /**
   * @brief Registry with `constant`, `timeseries`, `solar_generation` and `hourly_diurnal`.
   */
  static ParameterRegistry with_builtin_types();

  /**
   * @brief Register (or replace) a loader under a type name.
   */
  void add(const std::string& type, ParameterLoader loader);

  [[nodiscard]] bool contains(const std::string& type) const { return loaders_.find(type) != loaders_.end(); }

  /**
   * @brief Dispatch a definition to its type's loader; `ConfigurationError` for unknown types.
   */
  [[nodiscard]] LoadResult load(const ParameterDefinition& definition, const ParameterModel& model) const;

 private:
  std::unordered_map<std::string, ParameterLoader> loaders_{};
};

}  // namespace solargen::parameters
