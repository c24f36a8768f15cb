/**
 * @file timeseries_parameter.cpp
 * @brief CSV-backed step-hold time series implementation.
 * @author Watosn
 */

#include "solargen/parameters/timeseries_parameter.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

namespace solargen::parameters {
namespace {

std::optional<double> parse_time(const std::string& text) {
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end != text.c_str() && *end == '\0') {
    return v;
  }
  const auto epoch = solargen::core::calendar::parse_iso8601(text);
  if (!epoch.has_value()) {
    return std::nullopt;
  }
  return epoch->utc_seconds;
}

bool parse_sample_row(const std::string& line, TimeseriesParameter::Sample& out) {
  std::stringstream ss(line);
  std::string time_tok;
  std::string value_tok;
  if (!std::getline(ss, time_tok, ',') || !std::getline(ss, value_tok)) {
    return false;
  }
  if (!value_tok.empty() && value_tok.back() == '\r') {
    value_tok.pop_back();
  }
  const auto t = parse_time(time_tok);
  if (!t.has_value() || value_tok.empty()) {
    return false;
  }
  char* end = nullptr;
  const double v = std::strtod(value_tok.c_str(), &end);
  if (end == value_tok.c_str() || *end != '\0') {
    return false;
  }
  out.epoch_utc_s = *t;
  out.value = v;
  return true;
}

}  // namespace

std::unique_ptr<TimeseriesParameter> TimeseriesParameter::Create(const Config& config, solargen::core::Status* status) {
  std::ifstream in(config.csv_file);
  if (!in) {
    spdlog::error("failed to open timeseries csv: {}", config.csv_file.string());
    if (status != nullptr) {
      *status = solargen::core::Status::DataUnavailable;
    }
    return nullptr;
  }

  std::vector<Sample> samples;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    Sample row{};
    if (!parse_sample_row(line, row)) {
      if (line_no == 1) {
        continue;  // header
      }
      spdlog::warn("{}: skipping malformed row {}", config.csv_file.string(), line_no);
      continue;
    }
    samples.push_back(row);
  }
  return FromSamples(std::move(samples), status);
}

std::unique_ptr<TimeseriesParameter> TimeseriesParameter::FromSamples(std::vector<Sample> samples, solargen::core::Status* status) {
  if (samples.empty()) {
    spdlog::error("timeseries has no samples");
    if (status != nullptr) {
      *status = solargen::core::Status::ConfigurationError;
    }
    return nullptr;
  }
  std::stable_sort(samples.begin(), samples.end(), [](const Sample& a, const Sample& b) { return a.epoch_utc_s < b.epoch_utc_s; });
  if (status != nullptr) {
    *status = solargen::core::Status::Ok;
  }
  return std::unique_ptr<TimeseriesParameter>(new TimeseriesParameter(std::move(samples)));
}

ParameterValue TimeseriesParameter::value(const Timestep& timestep, int /*scenario_index*/) const {
  const double t = timestep.epoch.utc_seconds;
  const auto it = std::upper_bound(samples_.begin(), samples_.end(), t,
                                   [](const double ts, const Sample& s) { return ts < s.epoch_utc_s; });
  const Sample& s = (it == samples_.begin()) ? samples_.front() : *std::prev(it);
  return ParameterValue{.value = s.value, .status = solargen::core::Status::Ok};
}

}  // namespace solargen::parameters
