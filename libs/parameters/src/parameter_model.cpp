/**
 * @file parameter_model.cpp
 * @brief Named parameter collection implementation.
 * @author Watosn
 */

#include "solargen/parameters/parameter_model.hpp"

#include <cstddef>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

#include "solargen/parameters/registry.hpp"

namespace solargen::parameters {

/**
 * @brief Per-scenario values of one parameter for the current timestep.
 */
class ParameterModel::CachedValues final : public solargen::core::IValueSource {
 public:
  [[nodiscard]] double get_value(const int scenario_index) const override {
    if (scenario_index < 0 || static_cast<std::size_t>(scenario_index) >= values_.size()) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    return values_[static_cast<std::size_t>(scenario_index)];
  }

  void resize(const int scenario_count) { values_.assign(static_cast<std::size_t>(scenario_count), 0.0); }
  void set(const int scenario_index, const double value) { values_[static_cast<std::size_t>(scenario_index)] = value; }

 private:
  std::vector<double> values_{};
};

solargen::core::Status ParameterModel::add(const std::string& name, std::shared_ptr<IParameter> parameter) {
  if (name.empty() || !parameter || contains(name)) {
    spdlog::error("cannot add parameter '{}': empty name, null parameter or duplicate", name);
    return solargen::core::Status::ConfigurationError;
  }
  index_.emplace(name, entries_.size());
  names_.push_back(name);
  entries_.push_back(Entry{.parameter = std::move(parameter), .values = std::make_shared<CachedValues>()});
  return solargen::core::Status::Ok;
}

solargen::core::Status ParameterModel::load(const ParameterFile& file, const ParameterRegistry& registry, std::string* message) {
  if (file.status != solargen::core::Status::Ok) {
    if (message != nullptr) {
      *message = file.message;
    }
    return file.status;
  }
  for (const auto& def : file.definitions) {
    auto loaded = registry.load(def, *this);
    if (loaded.status == solargen::core::Status::Ok) {
      loaded.status = add(def.name, std::move(loaded.parameter));
    }
    if (loaded.status != solargen::core::Status::Ok) {
      if (message != nullptr) {
        *message = loaded.message.empty() ? def.name : loaded.message;
      }
      return loaded.status;
    }
  }
  return solargen::core::Status::Ok;
}

solargen::core::Status ParameterModel::setup(const SetupContext& context) {
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const auto status = entries_[i].parameter->setup(context);
    if (status != solargen::core::Status::Ok) {
      spdlog::error("setup of parameter '{}' failed: {}", names_[i], solargen::core::to_string(status));
      return status;
    }
  }
  return solargen::core::Status::Ok;
}

solargen::core::Status ParameterModel::step(const Timestep& timestep, const int scenario_count) {
  if (scenario_count <= 0) {
    return solargen::core::Status::InvalidInput;
  }
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    auto& entry = entries_[i];
    entry.values->resize(scenario_count);
    for (int si = 0; si < scenario_count; ++si) {
      const auto v = entry.parameter->value(timestep, si);
      if (v.status != solargen::core::Status::Ok) {
        spdlog::error("parameter '{}' failed at timestep {} scenario {}: {}", names_[i], timestep.index, si,
                      solargen::core::to_string(v.status));
        return v.status;
      }
      entry.values->set(si, v.value);
    }
  }
  return solargen::core::Status::Ok;
}

std::shared_ptr<const solargen::core::IValueSource> ParameterModel::source(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return entries_[it->second].values;
}

std::shared_ptr<IParameter> ParameterModel::parameter(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return entries_[it->second].parameter;
}

std::optional<double> ParameterModel::cached_value(const std::string& name, const int scenario_index) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return entries_[it->second].values->get_value(scenario_index);
}

}  // namespace solargen::parameters
