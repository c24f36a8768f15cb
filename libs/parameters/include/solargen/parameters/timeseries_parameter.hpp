/**
 * @file timeseries_parameter.hpp
 * @brief Step-hold time series parameter backed by a CSV file.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "solargen/parameters/parameter.hpp"

namespace solargen::parameters {

/**
 * @brief Piecewise-constant series: each row holds until the next row's epoch.
 */
class TimeseriesParameter final : public IParameter {
 public:
  /**
   * @brief One series row.
   */
  struct Sample {
    double epoch_utc_s{};
    double value{};
  };

  /**
   * @brief CSV provider configuration.
   *
   * Rows are `time,value` where `time` is UTC seconds or an ISO-8601 timestamp.
   */
  struct Config {
    std::filesystem::path csv_file{};
  };

  /**
   * @brief Factory helper that parses the CSV file.
   * @param status Set to `DataUnavailable` when the file cannot be read, `ConfigurationError` when it has no rows.
   * @return Parameter, or null on failure.
   */
  static std::unique_ptr<TimeseriesParameter> Create(const Config& config, solargen::core::Status* status = nullptr);

  /**
   * @brief Factory helper from in-memory samples (sorted on construction).
   */
  static std::unique_ptr<TimeseriesParameter> FromSamples(std::vector<Sample> samples, solargen::core::Status* status = nullptr);

  /**
   * @brief Value of the last row at or before the timestep; the first row before the series starts.
   */
  [[nodiscard]] ParameterValue value(const Timestep& timestep, int scenario_index) const override;

  [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }

 private:
  explicit TimeseriesParameter(std::vector<Sample> samples) : samples_(std::move(samples)) {}

  std::vector<Sample> samples_{};
};

}  // namespace solargen::parameters
