/**
 * @file parameter_file.cpp
 * @brief Parameter definition reader.
 * @author Watosn
 */

#include "solargen/parameters/parameter_file.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

namespace solargen::parameters {
namespace {

std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  return (first < last) ? std::string(first, last) : std::string{};
}

std::optional<double> parse_double(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return v;
}

ParameterFile fail(const std::size_t line_no, const std::string& what) {
  return ParameterFile{.definitions = {},
                       .status = solargen::core::Status::ConfigurationError,
                       .message = fmt::format("line {}: {}", line_no, what)};
}

}  // namespace

std::optional<std::string> ParameterDefinition::text(const std::string& key) const {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<double> ParameterDefinition::number(const std::string& key) const {
  const auto t = text(key);
  return t.has_value() ? parse_double(*t) : std::nullopt;
}

std::optional<bool> ParameterDefinition::flag(const std::string& key) const {
  const auto t = text(key);
  if (!t.has_value()) {
    return std::nullopt;
  }
  if (*t == "1" || *t == "true" || *t == "yes" || *t == "on") {
    return true;
  }
  if (*t == "0" || *t == "false" || *t == "no" || *t == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::vector<double>> ParameterDefinition::numbers(const std::string& key) const {
  const auto t = text(key);
  if (!t.has_value()) {
    return std::nullopt;
  }
  std::vector<double> out;
  std::stringstream ss(*t);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    const auto v = parse_double(trim(tok));
    if (!v.has_value()) {
      return std::nullopt;
    }
    out.push_back(*v);
  }
  return out;
}

ParameterFile parse_parameter_stream(std::istream& in) {
  ParameterFile out{};
  std::unordered_set<std::string> seen;
  std::string raw;
  std::size_t line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    const auto hash = raw.find('#');
    const std::string line = trim(hash == std::string::npos ? raw : raw.substr(0, hash));
    if (line.empty()) {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3) {
        return fail(line_no, "malformed section header");
      }
      ParameterDefinition def{};
      def.name = trim(line.substr(1, line.size() - 2));
      def.line = line_no;
      if (def.name.empty() || !seen.insert(def.name).second) {
        return fail(line_no, fmt::format("empty or duplicate parameter name '{}'", def.name));
      }
      out.definitions.push_back(std::move(def));
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      return fail(line_no, "expected 'key = value'");
    }
    if (out.definitions.empty()) {
      return fail(line_no, "key outside of a [parameter] section");
    }
    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));
    if (key.empty()) {
      return fail(line_no, "empty key");
    }
    auto& def = out.definitions.back();
    if (key == "type") {
      def.type = value;
    } else {
      def.fields[key] = value;
    }
  }

  for (const auto& def : out.definitions) {
    if (def.type.empty()) {
      return fail(def.line, fmt::format("parameter '{}' has no type", def.name));
    }
  }
  return out;
}

ParameterFile read_parameter_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return ParameterFile{.definitions = {},
                         .status = solargen::core::Status::DataUnavailable,
                         .message = fmt::format("cannot open parameter file: {}", path.string())};
  }
  return parse_parameter_stream(in);
}

}  // namespace solargen::parameters
