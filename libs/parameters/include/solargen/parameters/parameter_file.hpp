/**
 * @file parameter_file.hpp
 * @brief Declarative parameter definitions: `[name]` sections of `key = value` lines.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "solargen/core/types.hpp"

namespace solargen::parameters {

/**
 * @brief One parameter section. `type` is taken from the `type` key.
 */
struct ParameterDefinition {
  std::string name{};
  std::string type{};
  std::map<std::string, std::string> fields{};
  std::size_t line{};

  [[nodiscard]] bool has(const std::string& key) const { return fields.find(key) != fields.end(); }
  [[nodiscard]] std::optional<std::string> text(const std::string& key) const;
  [[nodiscard]] std::optional<double> number(const std::string& key) const;
  [[nodiscard]] std::optional<bool> flag(const std::string& key) const;
  [[nodiscard]] std::optional<std::vector<double>> numbers(const std::string& key) const;
};

/**
 * @brief Parsed parameter file with `status` set.
 *
 * Example:
 * @code
 * [direct]
 * type = constant
 * value = 800
 *
 * [pv]
 * type = solar_generation
 * latitude_deg = 51.5
 * direct_radiation_parameter = direct
 * @endcode
 */
struct ParameterFile {
  std::vector<ParameterDefinition> definitions{};
  solargen::core::Status status{solargen::core::Status::Ok};
  std::string message{};
};

[[nodiscard]] ParameterFile parse_parameter_stream(std::istream& in);
[[nodiscard]] ParameterFile read_parameter_file(const std::filesystem::path& path);

}  // namespace solargen::parameters
