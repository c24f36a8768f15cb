/**
 * @file solar_profile_batch_cli.cpp
 * @brief Batch parameter-file evaluation over a time range, CSV output.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "solargen/core/calendar.hpp"
#include "solargen/ephemeris/jpl_sun_ephemeris.hpp"
#include "solargen/parameters/parameter_model.hpp"
#include "solargen/parameters/registry.hpp"

int main(int argc, char** argv) {
  if (argc < 5 || argc > 7) {
    spdlog::error("usage: solar_profile_batch_cli <parameter_file> <output_csv> <start_utc_iso8601> <end_utc_iso8601> "
                  "[step_s] [scenarios]");
    spdlog::error("SOLARGEN_JPL_EPH_FILE, when set, supplies one shared ephemeris to every solar_generation parameter");
    return 1;
  }

  const std::filesystem::path parameter_file = argv[1];
  const std::filesystem::path output_csv = argv[2];
  const auto start = solargen::core::calendar::parse_iso8601(argv[3]);
  const auto end = solargen::core::calendar::parse_iso8601(argv[4]);
  const double step_s = (argc >= 6) ? std::atof(argv[5]) : 3600.0;
  const int scenarios = (argc >= 7) ? std::atoi(argv[6]) : 1;
  if (!start.has_value() || !end.has_value() || !(step_s > 0.0) || scenarios <= 0) {
    spdlog::error("invalid time range, step or scenario count");
    return 1;
  }

  const auto file = solargen::parameters::read_parameter_file(parameter_file);
  solargen::parameters::ParameterModel model;
  std::string message;
  const auto registry = solargen::parameters::ParameterRegistry::with_builtin_types();
  if (const auto status = model.load(file, registry, &message); status != solargen::core::Status::Ok) {
    spdlog::error("failed to load parameters ({}): {}", solargen::core::to_string(status), message);
    return 2;
  }

  solargen::parameters::SetupContext context{};
  if (const char* env = std::getenv("SOLARGEN_JPL_EPH_FILE"); env != nullptr && env[0] != '\0') {
    context.sun_ephemeris = solargen::ephemeris::JplSunEphemeris::Create({.ephemeris_file = env});
  }
  if (const auto status = model.setup(context); status != solargen::core::Status::Ok) {
    spdlog::error("parameter setup failed: {}", solargen::core::to_string(status));
    return 3;
  }

  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv.string());
    return 4;
  }
  out << "timestamp,index,hour,scenario";
  for (const auto& name : model.names()) {
    out << ',' << name;
  }
  out << '\n';

  int index = 0;
  for (double t = start->utc_seconds; t <= end->utc_seconds; t = start->utc_seconds + step_s * (++index)) {
    const auto timestep = solargen::parameters::make_timestep(solargen::core::Epoch{t}, index);
    if (const auto status = model.step(timestep, scenarios); status != solargen::core::Status::Ok) {
      spdlog::error("evaluation stopped at {}: {}", solargen::core::calendar::format_iso8601(timestep.epoch),
                    solargen::core::to_string(status));
      return 5;
    }
    for (int si = 0; si < scenarios; ++si) {
      out << fmt::format("{},{},{},{}", solargen::core::calendar::format_iso8601(timestep.epoch), timestep.index, timestep.hour, si);
      for (const auto& name : model.names()) {
        out << fmt::format(",{:.9g}", model.cached_value(name, si).value_or(0.0));
      }
      out << '\n';
    }
  }

  spdlog::info("wrote {} timesteps x {} scenarios to {}", index, scenarios, output_csv.string());
  return 0;
}
