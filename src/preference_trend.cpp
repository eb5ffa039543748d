/*
  Preference-trend projection over the year grid.

  Years up to the first reference year hold the first calibration; years
  between reference years interpolate log-linearly; years after the anchor
  (last reference year) follow
      log p(t) = log p* + (log p_anchor - log p*) * g(t)
  where p* is the asymptote and g the convergence weight.
*/
#include "edgetrp/core/preference_trend.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace edgetrp::core {

namespace {
// Below this span between the end points a law is numerically linear.
constexpr double kMinLawSpan = 1e-12;

void check_law_rate(ConvergenceLaw law, double rate, const std::string& where) {
  if (!std::isfinite(rate)) {
    throw ValueError(where + ": rate must be finite");
  }
  if (law != ConvergenceLaw::Linear && !(rate > 0.0)) {
    throw ValueError(where + ": rate must be > 0 for logistic and exponential laws");
  }
}

// Per-node plan for the years after the anchor.
struct NodePath {
  bool moves {false};
  double log_target {0.0};
  Year end {0};
  double rate {0.0};
  ConvergenceLaw law {ConvergenceLaw::Linear};
};

struct AdjustmentPath {
  bool moves {false};
  double final_fraction {1.0};
  Year end {0};
  double rate {0.0};
  ConvergenceLaw law {ConvergenceLaw::Linear};
};
} // namespace

void TrendTargets::add(TrendRule rule) {
  if (rule.node_key.empty()) {
    throw ValueError("TrendRule: node_key must not be empty");
  }
  if (rule.cluster < kAllClusters) {
    throw ValueError("TrendRule: cluster must be >= -1");
  }
  if (!(rule.target > 0.0) || !std::isfinite(rule.target)) {
    throw ValueError("TrendRule: target of '" + rule.node_key + "' must be finite and > 0");
  }
  check_law_rate(rule.law, rule.rate, "TrendRule");
  auto key = std::make_pair(rule.node_key, rule.cluster);
  trends_.insert_or_assign(std::move(key), std::move(rule));
}

void TrendTargets::add(InconvenienceRule rule) {
  if (rule.node_key.empty()) {
    throw ValueError("InconvenienceRule: node_key must not be empty");
  }
  if (rule.cluster < kAllClusters) {
    throw ValueError("InconvenienceRule: cluster must be >= -1");
  }
  if (!(rule.final_fraction >= 0.0) || !std::isfinite(rule.final_fraction)) {
    throw ValueError("InconvenienceRule: final_fraction of '" + rule.node_key + "' must be finite and >= 0");
  }
  check_law_rate(rule.law, rule.rate, "InconvenienceRule");
  auto key = std::make_pair(rule.node_key, rule.cluster);
  inconvenience_.insert_or_assign(std::move(key), std::move(rule));
}

const TrendRule* TrendTargets::find_trend(const std::string& node_key, int cluster) const {
  auto it = trends_.find({node_key, cluster});
  if (it != trends_.end()) return &it->second;
  it = trends_.find({node_key, kAllClusters});
  return it != trends_.end() ? &it->second : nullptr;
}

const InconvenienceRule* TrendTargets::find_inconvenience(const std::string& node_key, int cluster) const {
  auto it = inconvenience_.find({node_key, cluster});
  if (it != inconvenience_.end()) return &it->second;
  it = inconvenience_.find({node_key, kAllClusters});
  return it != inconvenience_.end() ? &it->second : nullptr;
}

double convergence_weight(ConvergenceLaw law, double rate, Year start, Year end, Year t) {
  check_law_rate(law, rate, "convergence_weight");
  if (t <= start) return 1.0;
  if (t >= end) return 0.0;
  const double x = static_cast<double>(t - start) / static_cast<double>(end - start);
  switch (law) {
    case ConvergenceLaw::Linear:
      return 1.0 - x;
    case ConvergenceLaw::Exponential: {
      const double tail = std::exp(-rate);
      if (1.0 - tail < kMinLawSpan) return 1.0 - x;
      return (std::exp(-rate * x) - tail) / (1.0 - tail);
    }
    case ConvergenceLaw::Logistic: {
      // Sigmoid centred mid-way, rescaled to hit 1 and 0 at the end points.
      auto f = [rate](double u) { return 1.0 / (1.0 + std::exp(rate * (u - 0.5))); };
      const double f0 = f(0.0);
      const double f1 = f(1.0);
      if (f0 - f1 < kMinLawSpan) return 1.0 - x;
      return (f(x) - f1) / (f0 - f1);
    }
  }
  throw ValueError("convergence_weight: unknown convergence law");
}

std::size_t RegionTrajectory::index_of(Year year) const {
  auto it = std::lower_bound(years.begin(), years.end(), year);
  if (it == years.end() || *it != year) {
    throw ValueError("RegionTrajectory: year " + std::to_string(year) +
                     " is not on the projection grid of " + region);
  }
  return static_cast<std::size_t>(it - years.begin());
}

std::span<const double> RegionTrajectory::preference_at(Year year) const {
  return preference[index_of(year)];
}

std::span<const double> RegionTrajectory::adjustment_at(Year year) const {
  const auto i = index_of(year);
  if (leaf_adjustment.empty()) return {};
  return leaf_adjustment[i];
}

const RegionTrajectory& PreferenceTrajectory::region(const std::string& name) const {
  auto it = regions.find(name);
  if (it == regions.end()) {
    throw ValueError("PreferenceTrajectory: no trajectory for region '" + name + "'");
  }
  return it->second;
}

RegionTrajectory project_region(const NestTopology& topo,
                                std::span<const CalibrationResult> calibrations,
                                int cluster,
                                std::span<const Year> years,
                                const TrendTargets& targets,
                                TrendOptions opts) {
  const auto N = static_cast<std::size_t>(topo.num_nodes());
  if (calibrations.empty()) {
    throw ValueError("project_region: at least one calibration is required");
  }
  if (!(opts.preference_floor > 0.0) || !std::isfinite(opts.preference_floor)) {
    throw ValueError("project_region: preference_floor must be finite and > 0");
  }
  if (!(opts.lifestyle_multiplier > 0.0) || !(opts.techswitch_multiplier > 0.0)) {
    throw ValueError("project_region: lever multipliers must be > 0");
  }
  check_law_rate(opts.default_law, opts.default_rate, "project_region");
  for (std::size_t i = 1; i < years.size(); ++i) {
    if (years[i] <= years[i - 1]) {
      throw ValueError("project_region: years must be strictly ascending");
    }
  }

  std::vector<const CalibrationResult*> cal;
  cal.reserve(calibrations.size());
  for (const auto& c : calibrations) {
    if (c.region != calibrations.front().region) {
      throw ValueError("project_region: calibrations of different regions");
    }
    if (c.preference.size() != N) {
      throw ValueError("project_region: calibration size does not match topology");
    }
    for (double p : c.preference) {
      if (!(p > 0.0) || !std::isfinite(p)) {
        throw ValueError("project_region: calibrated preferences of " + c.region + " must be finite and > 0");
      }
    }
    if (!c.leaf_adjustment.empty() && c.leaf_adjustment.size() != N) {
      throw ValueError("project_region: leaf adjustment size does not match topology");
    }
    cal.push_back(&c);
  }
  std::sort(cal.begin(), cal.end(), [](const CalibrationResult* a, const CalibrationResult* b) {
    return a->reference_year < b->reference_year;
  });
  for (std::size_t i = 1; i < cal.size(); ++i) {
    if (cal[i]->reference_year == cal[i - 1]->reference_year) {
      throw ValueError("project_region: duplicate reference year " + std::to_string(cal[i]->reference_year));
    }
  }
  const CalibrationResult& anchor = *cal.back();
  const Year anchor_year = anchor.reference_year;

  // A calibrated value below the floor (an unobserved but cheap alternative)
  // lowers that node's floor so the reference years stay reproducible.
  std::vector<double> floor(N, opts.preference_floor);
  for (const CalibrationResult* c : cal) {
    for (std::size_t k = 1; k < N; ++k) floor[k] = std::min(floor[k], c->preference[k]);
  }

  std::vector<NodePath> paths(N);
  for (std::size_t k = 1; k < N; ++k) {
    const auto n = static_cast<NodeId>(k);
    const auto& key = topo.key(n);
    double mult = 1.0;
    if (opts.smart_lifestyle &&
        std::find(opts.lifestyle_nodes.begin(), opts.lifestyle_nodes.end(), key) != opts.lifestyle_nodes.end()) {
      mult *= opts.lifestyle_multiplier;
    }
    if (!opts.techswitch.empty() && topo.is_leaf(n) && topo.technology(n) == opts.techswitch) {
      mult *= opts.techswitch_multiplier;
    }
    auto& p = paths[k];
    if (const TrendRule* rule = targets.find_trend(key, cluster)) {
      p = NodePath{true, std::log(rule->target * mult), rule->convergence_year, rule->rate, rule->law};
    } else if (mult != 1.0) {
      p = NodePath{true, std::log(anchor.preference[k] * mult), opts.default_convergence_year,
                   opts.default_rate, opts.default_law};
    }
  }

  std::vector<AdjustmentPath> adj_paths;
  if (opts.inconvenience) {
    adj_paths.resize(N);
    const auto parents = topo.parent_view();
    for (auto leaf : topo.leaves_view()) {
      for (NodeId a = leaf; a != kNoParent; a = parents[static_cast<std::size_t>(a)]) {
        if (const InconvenienceRule* rule = targets.find_inconvenience(topo.key(a), cluster)) {
          adj_paths[static_cast<std::size_t>(leaf)] =
              AdjustmentPath{true, rule->final_fraction, rule->convergence_year, rule->rate, rule->law};
          break;
        }
      }
    }
  }
  auto adjustment_of = [N](const CalibrationResult& c) {
    return c.leaf_adjustment.empty() ? std::vector<double>(N, 0.0) : c.leaf_adjustment;
  };

  RegionTrajectory out;
  out.region = anchor.region;
  out.cluster = cluster;
  out.years.assign(years.begin(), years.end());
  out.preference.reserve(years.size());
  if (opts.inconvenience) out.leaf_adjustment.reserve(years.size());

  for (Year t : years) {
    std::vector<double> pref(N, 1.0);
    std::vector<double> adj;
    if (t <= cal.front()->reference_year) {
      pref = cal.front()->preference;
      if (opts.inconvenience) adj = adjustment_of(*cal.front());
    } else if (t <= anchor_year) {
      std::size_t i = 1;
      while (cal[i]->reference_year < t) ++i;
      const CalibrationResult& lo = *cal[i - 1];
      const CalibrationResult& hi = *cal[i];
      const double w = static_cast<double>(t - lo.reference_year) /
                       static_cast<double>(hi.reference_year - lo.reference_year);
      for (std::size_t k = 0; k < N; ++k) {
        pref[k] = std::exp((1.0 - w) * std::log(lo.preference[k]) + w * std::log(hi.preference[k]));
      }
      if (opts.inconvenience) {
        const auto a0 = adjustment_of(lo);
        const auto a1 = adjustment_of(hi);
        adj.assign(N, 0.0);
        for (std::size_t k = 0; k < N; ++k) adj[k] = (1.0 - w) * a0[k] + w * a1[k];
      }
    } else {
      pref = anchor.preference;
      for (std::size_t k = 1; k < N; ++k) {
        const auto& p = paths[k];
        if (!p.moves) continue;
        const double g = convergence_weight(p.law, p.rate, anchor_year, p.end, t);
        pref[k] = std::exp(p.log_target + (std::log(anchor.preference[k]) - p.log_target) * g);
      }
      if (opts.inconvenience) {
        adj = adjustment_of(anchor);
        for (std::size_t k = 0; k < N; ++k) {
          const auto& p = adj_paths[k];
          if (!p.moves) continue;
          const double start = adj[k];
          const double final_value = start * p.final_fraction;
          adj[k] = final_value + (start - final_value) * convergence_weight(p.law, p.rate, anchor_year, p.end, t);
        }
      }
    }
    for (std::size_t k = 1; k < N; ++k) {
      pref[k] = std::max(pref[k], floor[k]);
    }
    pref[0] = 1.0;
    out.preference.push_back(std::move(pref));
    if (opts.inconvenience) out.leaf_adjustment.push_back(std::move(adj));
  }
  EDGETRP_LOG_DEBUG("projected preferences of {} (cluster {}) over {} years", out.region, cluster, years.size());
  return out;
}

PreferenceTrajectory project_preferences(const NestTopology& topo,
                                         std::span<const CalibrationResult> calibrations,
                                         const ClusterAssignment& clusters,
                                         std::span<const Year> years,
                                         const TrendTargets& targets,
                                         TrendOptions opts) {
  std::map<std::string, std::vector<CalibrationResult>> by_region;
  for (const auto& c : calibrations) by_region[c.region].push_back(c);

  PreferenceTrajectory out;
  for (const auto& [region, cals] : by_region) {
    const int cluster = clusters.cluster(region);
    out.regions.emplace(region, project_region(topo, cals, cluster, years, targets, opts));
  }
  EDGETRP_LOG_INFO("projected preferences for {} regions", out.regions.size());
  return out;
}

} // namespace edgetrp::core
