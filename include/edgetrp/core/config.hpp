/*
  Scenario configuration.

  A ScenarioConfig bundles the per-component option structs of one run.
  It is built once (from a named preset or a YAML document) and then only
  read; components receive their option struct by value.
*/
#pragma once

#include <string>
#include <vector>

#include "edgetrp/core/options.hpp"
#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

struct ScenarioConfig {
  std::string name {"default"};
  CalibrationMode mode {CalibrationMode::PreferenceOnly};
  std::vector<Year> years {default_years()};
  std::vector<Year> reference_years {2010};

  EvaluationOptions evaluation {};
  CalibrationOptions calibration {};
  ClusteringOptions clustering {};
  TrendOptions trend {};
  VintageOptions vintage {};

  // 1990, 2005-2060 every 5 years, 2070-2110 every 10, 2130, 2150.
  [[nodiscard]] static std::vector<Year> default_years();

  // Named presets: ConvCase, ElecEra, HydrHype, each optionally with the
  // "Wise" suffix that enables the lifestyle lever. Unknown names throw
  // ConfigError.
  [[nodiscard]] static ScenarioConfig for_scenario(const std::string& name);

  // Read a YAML document with a top-level "scenario" map. Fields that are
  // absent keep their defaults (or the preset's, when "preset" is given).
  // Throws ConfigError on malformed or invalid input.
  [[nodiscard]] static ScenarioConfig from_yaml_file(const std::string& path);
  [[nodiscard]] static ScenarioConfig from_yaml_string(const std::string& text);

  // Throws ConfigError when a field is out of range.
  void validate() const;
};

[[nodiscard]] const char* to_string(CalibrationMode mode) noexcept;
[[nodiscard]] const char* to_string(ConvergenceLaw law) noexcept;

} // namespace edgetrp::core
