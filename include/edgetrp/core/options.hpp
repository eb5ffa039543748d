/* Per-component option structs. Each component receives its options by
   value; ScenarioConfig aggregates them for a run. */
#pragma once

#include <string>
#include <vector>

#include "edgetrp/core/constants.hpp"
#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

struct EvaluationOptions {
  // When true, a leaf without a price record raises MissingPriceError
  // instead of being excluded from the choice set.
  bool require_prices {false};
};

struct CalibrationOptions {
  double preference_floor {kDefaultPreferenceFloor};
  // Applied when gathering leaf costs at the reference year. With
  // require_prices set, a missing record fails the calibration.
  EvaluationOptions evaluation {};
};

struct ClusteringOptions {
  int num_clusters {3};
  // Cluster on log(indicator); density-like indicators span orders of magnitude.
  bool log_transform {true};
};

struct TrendOptions {
  double preference_floor {kDefaultPreferenceFloor};
  // Convergence parameters used for nodes scaled by a lever but without a rule.
  Year default_convergence_year {2100};
  double default_rate {5.0};
  ConvergenceLaw default_law {ConvergenceLaw::Logistic};
  // Lifestyle lever: raise the asymptotic preference of the listed nodes.
  bool smart_lifestyle {false};
  double lifestyle_multiplier {2.0};
  std::vector<std::string> lifestyle_nodes {};
  // Technology switch: scale the asymptote of leaves with this technology.
  std::string techswitch {};
  double techswitch_multiplier {1.0};
  // Project inconvenience-cost paths alongside preferences.
  bool inconvenience {false};
};

struct VintageOptions {
  // Spacing in years of the back-dated cohorts that seed the first fleet.
  int initial_vintage_step {5};
};

} // namespace edgetrp::core
