/**
 * @file registry.cpp
 * @brief Built-in parameter loaders and registry dispatch.
 * @author Watosn
 */

#include "solargen/parameters/registry.hpp"

#include <optional>
#include <utility>

#include <fmt/format.h>

#include "solargen/parameters/constant_parameter.hpp"
#include "solargen/parameters/hourly_diurnal.hpp"
#include "solargen/parameters/parameter_model.hpp"
#include "solargen/parameters/solar_generation.hpp"
#include "solargen/parameters/timeseries_parameter.hpp"

namespace solargen::parameters {
namespace {

LoadResult config_error(const ParameterDefinition& def, const std::string& what) {
  return LoadResult{.parameter = nullptr,
                    .status = solargen::core::Status::ConfigurationError,
                    .message = fmt::format("parameter '{}' (line {}): {}", def.name, def.line, what)};
}

// Resolves an optional reference to an earlier parameter. Absent key: null source, Ok.
solargen::core::Status resolve_reference(const ParameterDefinition& def, const std::string& key, const ParameterModel& model,
                                         std::shared_ptr<const solargen::core::IValueSource>* out, std::string* missing) {
  const auto ref = def.text(key);
  if (!ref.has_value() || ref->empty()) {
    return solargen::core::Status::Ok;
  }
  auto source = model.source(*ref);
  if (!source) {
    *missing = *ref;
    return solargen::core::Status::ConfigurationError;
  }
  *out = std::move(source);
  return solargen::core::Status::Ok;
}

LoadResult load_constant(const ParameterDefinition& def, const ParameterModel& /*model*/) {
  const auto value = def.number("value");
  if (!value.has_value()) {
    return config_error(def, "missing or non-numeric 'value'");
  }
  return LoadResult{.parameter = std::make_shared<ConstantParameter>(*value)};
}

LoadResult load_timeseries(const ParameterDefinition& def, const ParameterModel& /*model*/) {
  const auto file = def.text("file");
  if (!file.has_value() || file->empty()) {
    return config_error(def, "missing 'file'");
  }
  solargen::core::Status status = solargen::core::Status::Ok;
  auto param = TimeseriesParameter::Create({.csv_file = *file}, &status);
  if (!param) {
    return LoadResult{.parameter = nullptr,
                      .status = status,
                      .message = fmt::format("parameter '{}': cannot load timeseries '{}'", def.name, *file)};
  }
  return LoadResult{.parameter = std::move(param)};
}

LoadResult load_hourly_diurnal(const ParameterDefinition& def, const ParameterModel& /*model*/) {
  const auto values = def.numbers("values");
  if (!values.has_value()) {
    return config_error(def, "missing or non-numeric 'values'");
  }
  solargen::core::Status status = solargen::core::Status::Ok;
  auto param = HourlyDiurnalParameter::Create(*values, &status);
  if (!param) {
    return config_error(def, fmt::format("'values' must hold 24 entries, got {}", values->size()));
  }
  return LoadResult{.parameter = std::move(param)};
}

LoadResult load_solar_generation(const ParameterDefinition& def, const ParameterModel& model) {
  SolarGenerationParameter::Config config{};

  const auto lat = def.number("latitude_deg");
  const auto lon = def.number("longitude_deg");
  if (lat.has_value() && lon.has_value()) {
    config.position = solargen::core::GeodeticPoint{.lat_deg = *lat, .lon_deg = *lon, .alt_m = def.number("elevation_m").value_or(0.0)};
  }
  config.collector_azimuth_rad = def.number("collector_azimuth");
  config.collector_tilt_rad = def.number("collector_tilt");
  config.collector_area_m2 = def.number("collector_area");
  config.ephemeris_file = def.text("ephemeris_file").value_or(std::string{});

  config.session.refraction.enabled = def.flag("refraction").value_or(false);
  config.session.refraction.pressure_mbar = def.number("pressure_mbar").value_or(config.session.refraction.pressure_mbar);
  config.session.refraction.temperature_c = def.number("temperature_c").value_or(config.session.refraction.temperature_c);
  config.session.eop.dut1_s = def.number("dut1_s").value_or(0.0);

  std::string missing;
  if (resolve_reference(def, "direct_radiation_parameter", model, &config.direct_radiation, &missing) !=
      solargen::core::Status::Ok) {
    return config_error(def, fmt::format("unknown direct_radiation_parameter '{}'", missing));
  }
  if (resolve_reference(def, "diffuse_radiation_parameter", model, &config.diffuse_radiation, &missing) !=
      solargen::core::Status::Ok) {
    return config_error(def, fmt::format("unknown diffuse_radiation_parameter '{}'", missing));
  }

  solargen::core::Status status = solargen::core::Status::Ok;
  auto param = SolarGenerationParameter::Create(config, &status);
  if (!param) {
    return config_error(def, "collector geometry requires latitude_deg, longitude_deg, collector_azimuth, "
                             "collector_tilt (0..pi) and collector_area (> 0)");
  }
  return LoadResult{.parameter = std::move(param)};
}

}  // namespace

ParameterRegistry ParameterRegistry::with_builtin_types() {
  ParameterRegistry registry;
  registry.add("constant", load_constant);
  registry.add("timeseries", load_timeseries);
  registry.add("hourly_diurnal", load_hourly_diurnal);
  registry.add("solar_generation", load_solar_generation);
  return registry;
}

void ParameterRegistry::add(const std::string& type, ParameterLoader loader) {
  if (!loader) {
    return;
  }
  loaders_[type] = std::move(loader);
}

LoadResult ParameterRegistry::load(const ParameterDefinition& definition, const ParameterModel& model) const {
  const auto it = loaders_.find(definition.type);
  if (it == loaders_.end()) {
    return config_error(definition, fmt::format("unknown parameter type '{}'", definition.type));
  }
  return it->second(definition, model);
}

}  // namespace solargen::parameters
