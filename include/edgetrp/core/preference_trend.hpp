/*
  Preference-trend projection: extends calibrated preferences (and, in the
  inconvenience variant, leaf cost adjustments) over the simulation year grid.

  Each node moves in log space from its value at the anchor year (the last
  reference year) toward a long-run asymptote along a convergence law.
  Rules are looked up per node key and cluster; a rule for cluster -1
  applies to every cluster that has no rule of its own.
*/
#pragma once

#include <map>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "edgetrp/core/calibrator.hpp"
#include "edgetrp/core/clustering.hpp"
#include "edgetrp/core/nest_topology.hpp"
#include "edgetrp/core/options.hpp"
#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

inline constexpr int kAllClusters = -1;

// Long-run asymptotic preference of one node.
struct TrendRule {
  std::string node_key;
  int cluster {kAllClusters};
  double target {1.0};
  Year convergence_year {2100};
  double rate {5.0};
  ConvergenceLaw law {ConvergenceLaw::Logistic};
};

// Path of an inconvenience cost adjustment from its anchor value toward
// final_fraction * anchor. Applies to the leaves under node_key.
struct InconvenienceRule {
  std::string node_key;
  int cluster {kAllClusters};
  double final_fraction {0.0};
  Year convergence_year {2100};
  double rate {5.0};
  ConvergenceLaw law {ConvergenceLaw::Exponential};
};

class TrendTargets {
public:
  // Validates and stores the rule; a later rule for the same
  // (node_key, cluster) replaces the earlier one.
  void add(TrendRule rule);
  void add(InconvenienceRule rule);

  // Cluster-specific rule if present, otherwise the all-cluster rule.
  [[nodiscard]] const TrendRule* find_trend(const std::string& node_key, int cluster) const;
  [[nodiscard]] const InconvenienceRule* find_inconvenience(const std::string& node_key, int cluster) const;

  [[nodiscard]] std::size_t num_trend_rules() const noexcept { return trends_.size(); }
  [[nodiscard]] std::size_t num_inconvenience_rules() const noexcept { return inconvenience_.size(); }

private:
  std::map<std::pair<std::string, int>, TrendRule> trends_ {};
  std::map<std::pair<std::string, int>, InconvenienceRule> inconvenience_ {};
};

// Weight of the anchor value at year t: 1 at or before start, 0 at or after
// end, non-increasing in between. rate must be > 0 for the logistic and
// exponential laws.
[[nodiscard]] double convergence_weight(ConvergenceLaw law, double rate, Year start, Year end, Year t);

// Projected parameters of one region on the year grid.
struct RegionTrajectory {
  std::string region;
  int cluster {0};
  std::vector<Year> years;
  std::vector<std::vector<double>> preference;      // [year index][node]
  std::vector<std::vector<double>> leaf_adjustment; // [year index][node]; empty without inconvenience

  // Throws ValueError for a year outside the grid.
  [[nodiscard]] std::span<const double> preference_at(Year year) const;
  // Empty span when no adjustments were projected.
  [[nodiscard]] std::span<const double> adjustment_at(Year year) const;

private:
  [[nodiscard]] std::size_t index_of(Year year) const;
};

struct PreferenceTrajectory {
  std::map<std::string, RegionTrajectory> regions;

  [[nodiscard]] const RegionTrajectory& region(const std::string& name) const;
};

// Project one region. calibrations must all belong to the same region and
// carry distinct reference years; years must be strictly ascending.
[[nodiscard]] RegionTrajectory project_region(const NestTopology& topo,
                                              std::span<const CalibrationResult> calibrations,
                                              int cluster,
                                              std::span<const Year> years,
                                              const TrendTargets& targets,
                                              TrendOptions opts = {});

// Project every region found in calibrations. Output depends only on the
// calibrations, the cluster of each region, the targets, the options and
// the year, so equal inputs within a cluster give equal trajectories.
[[nodiscard]] PreferenceTrajectory project_preferences(const NestTopology& topo,
                                                       std::span<const CalibrationResult> calibrations,
                                                       const ClusterAssignment& clusters,
                                                       std::span<const Year> years,
                                                       const TrendTargets& targets,
                                                       TrendOptions opts = {});

} // namespace edgetrp::core
