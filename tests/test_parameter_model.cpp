/**
 * @file test_parameter_model.cpp
 * @brief Parameter file, registry and model evaluation tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "solargen/core/calendar.hpp"
#include "solargen/ephemeris/fixed_provider.hpp"
#include "solargen/parameters/constant_parameter.hpp"
#include "solargen/parameters/parameter_file.hpp"
#include "solargen/parameters/parameter_model.hpp"
#include "solargen/parameters/registry.hpp"
#include "solargen/parameters/solar_generation.hpp"
#include "solargen/parameters/timeseries_parameter.hpp"

namespace {

using solargen::core::Status;

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

solargen::parameters::ParameterFile parse(const std::string& text) {
  std::istringstream in(text);
  return solargen::parameters::parse_parameter_stream(in);
}

std::string site_model_text() {
  const auto csv = (std::filesystem::path(SOLARGEN_TEST_DATA_DIR) / "irradiance.csv").string();
  return "# rooftop array\n"
         "[irradiance]\n"
         "type = timeseries\n"
         "file = " + csv + "\n"
         "\n"
         "[diffuse]\n"
         "type = constant\n"
         "value = 120   # W/m^2\n"
         "\n"
         "[load_profile]\n"
         "type = hourly_diurnal\n"
         "values = 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23, 24\n"
         "\n"
         "[panel]\n"
         "type = solar_generation\n"
         "latitude_deg = 40.0\n"
         "longitude_deg = -105.0\n"
         "elevation_m = 1600\n"
         "collector_azimuth = 3.14159\n"
         "collector_tilt = 0.5\n"
         "collector_area = 10\n"
         "direct_radiation_parameter = irradiance\n"
         "diffuse_radiation_parameter = diffuse\n";
}

}  // namespace

int main() {
  using solargen::parameters::ParameterModel;
  using solargen::parameters::ParameterRegistry;

  const auto registry = ParameterRegistry::with_builtin_types();
  if (!registry.contains("constant") || !registry.contains("timeseries") || !registry.contains("hourly_diurnal") ||
      !registry.contains("solar_generation") || registry.contains("wind_turbine")) {
    spdlog::error("builtin registry contents mismatch");
    return 1;
  }

  const auto file = parse(site_model_text());
  if (file.status != Status::Ok || file.definitions.size() != 4 || file.definitions[1].type != "constant" ||
      file.definitions[1].number("value") != 120.0 || file.definitions[3].line != 14) {
    spdlog::error("parameter file parse mismatch: {}", file.message);
    return 2;
  }

  ParameterModel model;
  std::string message;
  if (model.load(file, registry, &message) != Status::Ok || model.names().size() != 4 || model.names()[3] != "panel") {
    spdlog::error("model load failed: {}", message);
    return 3;
  }
  const auto series = std::dynamic_pointer_cast<solargen::parameters::TimeseriesParameter>(model.parameter("irradiance"));
  if (!series || series->size() != 3) {
    spdlog::error("timeseries should hold three valid samples");
    return 4;
  }

  // No ephemeris anywhere: the collector cannot be set up.
  if (model.setup({}) != Status::DataUnavailable) {
    spdlog::error("setup without ephemeris should be data unavailable");
    return 5;
  }

  const auto panel = std::dynamic_pointer_cast<solargen::parameters::SolarGenerationParameter>(model.parameter("panel"));
  const double sun_alt = 1.0;
  const double sun_az = 3.0;
  if (!panel || panel->bind_session(std::make_shared<solargen::ephemeris::FixedSolarPositionProvider>(sun_alt, sun_az)) != Status::Ok ||
      model.setup({}) != Status::Ok) {
    spdlog::error("setup with bound session failed");
    return 6;
  }

  const auto noon_thirty = solargen::core::calendar::parse_iso8601("2024-06-21T12:30:00Z");
  const auto two_thirty = solargen::core::calendar::parse_iso8601("2024-06-21T14:30:00Z");
  if (!noon_thirty || !two_thirty) {
    spdlog::error("timestamp parse failed");
    return 7;
  }
  if (model.step(solargen::parameters::make_timestep(*noon_thirty, 0), 2) != Status::Ok) {
    spdlog::error("step failed");
    return 8;
  }
  const double incidence = solargen::parameters::incidence_factor(sun_alt, sun_az, 3.14159, 0.5);
  const double diffuse_factor = solargen::parameters::diffuse_view_factor(0.5);
  const double expected_noon = (850.0 * incidence + diffuse_factor * 120.0) * 10.0;
  for (int si = 0; si < 2; ++si) {
    if (model.cached_value("irradiance", si) != 850.0 || model.cached_value("load_profile", si) != 12.0 ||
        !approx_abs(model.cached_value("panel", si).value_or(0.0), expected_noon, 1e-9)) {
      spdlog::error("cached values mismatch at scenario {}", si);
      return 9;
    }
  }
  if (model.cached_value("missing", 0).has_value() || !std::isnan(model.cached_value("panel", 2).value_or(0.0))) {
    spdlog::error("unknown name / scenario lookup mismatch");
    return 10;
  }

  // References read the current step's cached value.
  if (model.step(solargen::parameters::make_timestep(*two_thirty, 1), 1) != Status::Ok ||
      !approx_abs(model.cached_value("panel", 0).value_or(0.0), (400.0 * incidence + diffuse_factor * 120.0) * 10.0, 1e-9)) {
    spdlog::error("dependent parameter did not follow its reference");
    return 11;
  }

  if (model.step(solargen::parameters::make_timestep(*two_thirty, 2), 0) != Status::InvalidInput) {
    spdlog::error("zero scenarios should be invalid input");
    return 12;
  }
  solargen::parameters::Timestep bad_hour{.epoch = *two_thirty, .index = 3, .hour = 0};
  if (model.step(bad_hour, 1) != Status::OutOfRange) {
    spdlog::error("diurnal range fault should stop the step");
    return 13;
  }

  if (model.add("diffuse", std::make_shared<solargen::parameters::ConstantParameter>(1.0)) != Status::ConfigurationError ||
      model.add("spare", nullptr) != Status::ConfigurationError ||
      model.add("spare", std::make_shared<solargen::parameters::ConstantParameter>(1.0)) != Status::Ok) {
    spdlog::error("model add validation mismatch");
    return 14;
  }

  // Loader failures surface as configuration errors with a message.
  ParameterModel unresolved;
  const auto dangling = parse("[panel]\ntype = solar_generation\nlatitude_deg = 0\nlongitude_deg = 0\ncollector_azimuth = 0\n"
                              "collector_tilt = 0\ncollector_area = 1\ndirect_radiation_parameter = cloud\n");
  if (unresolved.load(dangling, registry, &message) != Status::ConfigurationError ||
      message.find("cloud") == std::string::npos) {
    spdlog::error("dangling reference should be a configuration error: {}", message);
    return 15;
  }
  ParameterModel incomplete;
  if (incomplete.load(parse("[panel]\ntype = solar_generation\nlatitude_deg = 0\nlongitude_deg = 0\ncollector_area = 1\n"),
                      registry, &message) != Status::ConfigurationError) {
    spdlog::error("missing collector geometry should be a configuration error");
    return 16;
  }
  ParameterModel unknown;
  if (unknown.load(parse("[x]\ntype = wind_turbine\n"), registry, &message) != Status::ConfigurationError ||
      message.find("wind_turbine") == std::string::npos) {
    spdlog::error("unknown type should be a configuration error");
    return 17;
  }
  ParameterModel short_profile;
  if (short_profile.load(parse("[p]\ntype = hourly_diurnal\nvalues = 1, 2, 3\n"), registry, &message) != Status::ConfigurationError) {
    spdlog::error("short diurnal profile should be a configuration error");
    return 18;
  }

  // Malformed files.
  if (parse("value = 1\n").status != Status::ConfigurationError || parse("[a]\nvalue = 1\n").status != Status::ConfigurationError ||
      parse("[a]\ntype = constant\n[a]\ntype = constant\n").status != Status::ConfigurationError ||
      parse("[a\ntype = constant\n").status != Status::ConfigurationError) {
    spdlog::error("malformed parameter files should be rejected");
    return 19;
  }
  const auto missing = solargen::parameters::read_parameter_file("does/not/exist.ini");
  ParameterModel from_missing;
  if (missing.status != Status::DataUnavailable || from_missing.load(missing, registry, &message) != Status::DataUnavailable) {
    spdlog::error("missing parameter file should be data unavailable");
    return 20;
  }

  return 0;
}
