/*
  ScenarioConfig presets and YAML parsing (yaml-cpp).
*/
#include "edgetrp/core/config.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"

#include <cmath>
#include <string>

#include <yaml-cpp/yaml.h>

namespace edgetrp::core {

namespace {
constexpr double kTechswitchMultiplier = 2.0;

CalibrationMode parse_mode(const std::string& s) {
  if (s == "preference_only") return CalibrationMode::PreferenceOnly;
  if (s == "inconvenience") return CalibrationMode::Inconvenience;
  throw ConfigError("unknown calibration_mode '" + s + "' (expected preference_only or inconvenience)");
}

ConvergenceLaw parse_law(const std::string& s) {
  if (s == "logistic") return ConvergenceLaw::Logistic;
  if (s == "exponential") return ConvergenceLaw::Exponential;
  if (s == "linear") return ConvergenceLaw::Linear;
  throw ConfigError("unknown convergence law '" + s + "' (expected logistic, exponential or linear)");
}

template <typename T>
void read_if(const YAML::Node& node, const char* key, T& out) {
  if (node[key]) out = node[key].as<T>();
}

ScenarioConfig parse_root(const YAML::Node& root, const std::string& origin) {
  if (!root["scenario"]) {
    throw ConfigError("YAML config missing 'scenario' section: " + origin);
  }
  const YAML::Node section = root["scenario"];

  ScenarioConfig cfg;
  if (section["preset"]) {
    cfg = ScenarioConfig::for_scenario(section["preset"].as<std::string>());
  }
  read_if(section, "name", cfg.name);
  if (section["calibration_mode"]) {
    cfg.mode = parse_mode(section["calibration_mode"].as<std::string>());
  }
  read_if(section, "years", cfg.years);
  read_if(section, "reference_years", cfg.reference_years);

  if (section["evaluation"]) {
    read_if(section["evaluation"], "require_prices", cfg.evaluation.require_prices);
  }
  if (section["calibration"]) {
    read_if(section["calibration"], "preference_floor", cfg.calibration.preference_floor);
  }
  if (section["clustering"]) {
    const YAML::Node c = section["clustering"];
    read_if(c, "num_clusters", cfg.clustering.num_clusters);
    read_if(c, "log_transform", cfg.clustering.log_transform);
  }
  // The trend floor follows the calibration floor unless set explicitly.
  cfg.trend.preference_floor = cfg.calibration.preference_floor;
  if (section["trend"]) {
    const YAML::Node t = section["trend"];
    read_if(t, "preference_floor", cfg.trend.preference_floor);
    read_if(t, "default_convergence_year", cfg.trend.default_convergence_year);
    read_if(t, "default_rate", cfg.trend.default_rate);
    if (t["default_law"]) {
      cfg.trend.default_law = parse_law(t["default_law"].as<std::string>());
    }
    read_if(t, "smart_lifestyle", cfg.trend.smart_lifestyle);
    read_if(t, "lifestyle_multiplier", cfg.trend.lifestyle_multiplier);
    read_if(t, "lifestyle_nodes", cfg.trend.lifestyle_nodes);
    read_if(t, "techswitch", cfg.trend.techswitch);
    read_if(t, "techswitch_multiplier", cfg.trend.techswitch_multiplier);
  }
  if (section["vintage"]) {
    read_if(section["vintage"], "initial_vintage_step", cfg.vintage.initial_vintage_step);
  }
  cfg.trend.inconvenience = cfg.mode == CalibrationMode::Inconvenience;
  cfg.validate();
  EDGETRP_LOG_INFO("loaded scenario '{}' ({}) from {}", cfg.name, to_string(cfg.mode), origin);
  return cfg;
}

void check_ascending(const std::vector<Year>& ys, const char* what) {
  if (ys.empty()) {
    throw ConfigError(std::string(what) + " must not be empty");
  }
  for (std::size_t i = 1; i < ys.size(); ++i) {
    if (ys[i] <= ys[i - 1]) {
      throw ConfigError(std::string(what) + " must be strictly ascending");
    }
  }
}
} // namespace

std::vector<Year> ScenarioConfig::default_years() {
  std::vector<Year> ys {1990};
  for (Year y = 2005; y <= 2060; y += 5) ys.push_back(y);
  for (Year y = 2070; y <= 2110; y += 10) ys.push_back(y);
  ys.push_back(2130);
  ys.push_back(2150);
  return ys;
}

ScenarioConfig ScenarioConfig::for_scenario(const std::string& name) {
  static const std::string kWise = "Wise";
  std::string base = name;
  bool wise = false;
  if (base.size() > kWise.size() && base.compare(base.size() - kWise.size(), kWise.size(), kWise) == 0) {
    base.erase(base.size() - kWise.size());
    wise = true;
  }

  ScenarioConfig cfg;
  cfg.name = name;
  if (base == "ConvCase") {
    cfg.trend.techswitch = "Liquids";
  } else if (base == "ElecEra") {
    cfg.trend.techswitch = "BEV";
  } else if (base == "HydrHype") {
    cfg.trend.techswitch = "FCEV";
  } else {
    throw ConfigError("unknown scenario '" + name + "'; allowed are ConvCase, ConvCaseWise, "
                      "ElecEra, ElecEraWise, HydrHype, HydrHypeWise");
  }
  cfg.trend.techswitch_multiplier = kTechswitchMultiplier;
  if (wise) {
    cfg.trend.smart_lifestyle = true;
    cfg.trend.lifestyle_nodes = {"Walk", "Cycle"};
  }
  return cfg;
}

ScenarioConfig ScenarioConfig::from_yaml_file(const std::string& path) {
  try {
    return parse_root(YAML::LoadFile(path), path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("failed to read scenario config " + path + ": " + e.what());
  }
}

ScenarioConfig ScenarioConfig::from_yaml_string(const std::string& text) {
  try {
    return parse_root(YAML::Load(text), "<string>");
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("failed to parse scenario config: ") + e.what());
  }
}

void ScenarioConfig::validate() const {
  if (name.empty()) {
    throw ConfigError("scenario name must not be empty");
  }
  check_ascending(years, "years");
  check_ascending(reference_years, "reference_years");
  if (reference_years.front() < years.front() || reference_years.back() > years.back()) {
    throw ConfigError("reference_years must lie within the year grid");
  }
  if (!(calibration.preference_floor > 0.0) || !std::isfinite(calibration.preference_floor)) {
    throw ConfigError("calibration.preference_floor must be finite and > 0");
  }
  if (!(trend.preference_floor > 0.0) || !std::isfinite(trend.preference_floor)) {
    throw ConfigError("trend.preference_floor must be finite and > 0");
  }
  if (clustering.num_clusters < 1) {
    throw ConfigError("clustering.num_clusters must be >= 1");
  }
  if (trend.default_law != ConvergenceLaw::Linear && !(trend.default_rate > 0.0)) {
    throw ConfigError("trend.default_rate must be > 0");
  }
  if (trend.default_convergence_year <= reference_years.back()) {
    throw ConfigError("trend.default_convergence_year must follow the last reference year");
  }
  if (!(trend.lifestyle_multiplier > 0.0) || !(trend.techswitch_multiplier > 0.0)) {
    throw ConfigError("trend lever multipliers must be > 0");
  }
  if (trend.smart_lifestyle && trend.lifestyle_nodes.empty()) {
    throw ConfigError("trend.smart_lifestyle requires lifestyle_nodes");
  }
  if (vintage.initial_vintage_step < 1) {
    throw ConfigError("vintage.initial_vintage_step must be >= 1");
  }
}

const char* to_string(CalibrationMode mode) noexcept {
  switch (mode) {
    case CalibrationMode::PreferenceOnly: return "preference_only";
    case CalibrationMode::Inconvenience: return "inconvenience";
  }
  return "unknown";
}

const char* to_string(ConvergenceLaw law) noexcept {
  switch (law) {
    case ConvergenceLaw::Logistic: return "logistic";
    case ConvergenceLaw::Exponential: return "exponential";
    case ConvergenceLaw::Linear: return "linear";
  }
  return "unknown";
}

} // namespace edgetrp::core
