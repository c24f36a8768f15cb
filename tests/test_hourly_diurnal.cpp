/**
 * @file test_hourly_diurnal.cpp
 * @brief Diurnal profile lookup tests.
 * @author Watosn
 */

#include <vector>

#include <spdlog/spdlog.h>

#include "solargen/core/calendar.hpp"
#include "solargen/parameters/hourly_diurnal.hpp"

int main() {
  using solargen::core::Status;
  using solargen::parameters::HourlyDiurnalParameter;

  HourlyDiurnalParameter::Table table{};
  for (std::size_t i = 0; i < table.size(); ++i) {
    table[i] = 10.0 + static_cast<double>(i);
  }
  const HourlyDiurnalParameter profile(table);

  for (int hour = 1; hour <= 24; ++hour) {
    const auto out = profile.value_at_hour(hour);
    if (out.status != Status::Ok || out.value != 9.0 + hour) {
      spdlog::error("hour {} returned {} (status {})", hour, out.value, solargen::core::to_string(out.status));
      return 1;
    }
  }
  if (profile.value_at_hour(0).status != Status::OutOfRange || profile.value_at_hour(25).status != Status::OutOfRange ||
      profile.value_at_hour(-3).status != Status::OutOfRange) {
    spdlog::error("hours outside 1..24 should be out of range");
    return 2;
  }

  // Hour-ending convention: 06:00 closes hour 6, midnight closes hour 24 of the previous day.
  const auto six = solargen::core::calendar::parse_iso8601("2024-03-10T06:00:00Z");
  const auto six_thirty = solargen::core::calendar::parse_iso8601("2024-03-10T06:30:00Z");
  const auto midnight = solargen::core::calendar::parse_iso8601("2024-03-11T00:00:00Z");
  if (!six || !six_thirty || !midnight) {
    spdlog::error("timestamp parse failed");
    return 3;
  }
  const auto ts_six = solargen::parameters::make_timestep(*six, 6);
  const auto ts_midnight = solargen::parameters::make_timestep(*midnight, 24);
  if (ts_six.hour != 6 || solargen::parameters::make_timestep(*six_thirty, 0).hour != 6 || ts_midnight.hour != 24) {
    spdlog::error("hour-of-day derivation mismatch");
    return 4;
  }
  if (profile.value(ts_six, 0).value != 15.0 || profile.value(ts_midnight, 3).value != 33.0) {
    spdlog::error("timestep lookup mismatch");
    return 5;
  }

  Status status = Status::Ok;
  if (HourlyDiurnalParameter::Create(std::vector<double>(23, 1.0), &status) || status != Status::ConfigurationError) {
    spdlog::error("23-entry profile should be rejected");
    return 6;
  }
  const auto created = HourlyDiurnalParameter::Create(std::vector<double>(table.begin(), table.end()), &status);
  if (!created || status != Status::Ok || created->values() != table) {
    spdlog::error("24-entry profile should be accepted");
    return 7;
  }

  return 0;
}
