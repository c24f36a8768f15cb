/**
 * @file parameter_model.hpp
 * @brief Named parameter collection with per-timestep evaluation and value caching.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "solargen/parameters/parameter.hpp"
#include "solargen/parameters/parameter_file.hpp"

namespace solargen::parameters {

class ParameterRegistry;

/**
 * @brief Ordered set of named parameters evaluated once per timestep.
 *
 * Parameters are evaluated in insertion order. A parameter may only reference
 * parameters added before it, so insertion order is a valid dependency order.
 * Cached values of the current timestep are exposed to dependants through
 * `source()`.
 */
class ParameterModel final {
 public:
  /**
   * @brief Add a parameter under a unique name.
   * @return `ConfigurationError` on empty/duplicate name or null parameter.
   */
  [[nodiscard]] solargen::core::Status add(const std::string& name, std::shared_ptr<IParameter> parameter);

  /**
   * @brief Instantiate every definition of a parameter file through the registry.
   * @param message Receives a description of the first failure.
   */
  [[nodiscard]] solargen::core::Status load(const ParameterFile& file, const ParameterRegistry& registry,
                                            std::string* message = nullptr);

  /**
   * @brief Run `setup` on every parameter; stops at the first failure.
   */
  [[nodiscard]] solargen::core::Status setup(const SetupContext& context);

  /**
   * @brief Evaluate all parameters for one timestep and `scenario_count` scenarios.
   *
   * Stops at the first non-Ok status; that status is returned.
   */
  [[nodiscard]] solargen::core::Status step(const Timestep& timestep, int scenario_count);

  /**
   * @brief Value-source view of a parameter's cached values; null for unknown names.
   */
  [[nodiscard]] std::shared_ptr<const solargen::core::IValueSource> source(const std::string& name) const;

  [[nodiscard]] std::shared_ptr<IParameter> parameter(const std::string& name) const;
  [[nodiscard]] std::optional<double> cached_value(const std::string& name, int scenario_index) const;
  [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }
  [[nodiscard]] bool contains(const std::string& name) const { return index_.find(name) != index_.end(); }

 private:
  class CachedValues;

  struct Entry {
    std::shared_ptr<IParameter> parameter{};
    std::shared_ptr<CachedValues> values{};
  };

  std::vector<Entry> entries_{};
  std::vector<std::string> names_{};
  std::unordered_map<std::string, std::size_t> index_{};
};

}  // namespace solargen::parameters
