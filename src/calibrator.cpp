/*
  Preference calibration by closed-form inversion of the nested logit.

  For a nest n with exponent lambda and observed conditional shares s_i, the
  logit share equation s_i ∝ p_i * C_i^(-1/lambda) is solved relative to the
  reference sibling r (largest observed share):
      p_i = (s_i / s_r) * (C_i / C_r)^(1/lambda),   p_r = 1.
  A child with observed share 0 takes s_i / s_r = preference_floor.
  Nests are processed bottom-up so that the calibrated inclusive value of a
  sub-nest is the cost its parent inverts against.
*/
#include "edgetrp/core/calibrator.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"

#include <cmath>
#include <limits>

namespace edgetrp::core {

std::vector<double> observed_leaf_quantities(const NestTopology& topo,
                                             const ObservedShareTable& observed,
                                             const std::string& region,
                                             Year reference_year) {
  std::vector<double> q(static_cast<std::size_t>(topo.num_nodes()), 0.0);
  for (auto leaf : topo.leaves_view()) {
    q[static_cast<std::size_t>(leaf)] =
        observed.find(region, topo.vehicle_type(leaf), topo.technology(leaf), reference_year).value_or(0.0);
  }
  return q;
}

CalibrationResult invert_nest(const NestTopology& topo,
                              const LeafCosts& costs,
                              std::span<const double> observed,
                              CalibrationOptions opts) {
  const auto N = static_cast<std::size_t>(topo.num_nodes());
  if (costs.cost.size() != N || costs.available.size() != N) {
    throw ValueError("invert_nest: leaf cost arrays must have length num_nodes");
  }
  if (observed.size() != N) {
    throw ValueError("invert_nest: observed length must equal num_nodes");
  }
  if (!(opts.preference_floor > 0.0) || !std::isfinite(opts.preference_floor)) {
    throw ValueError("invert_nest: preference_floor must be finite and > 0");
  }
  const auto parents = topo.parent_view();
  const auto exponents = topo.exponent_view();

  // Observed quantity per node: leaves as given, internal nodes summed.
  std::vector<double> q(N, 0.0);
  for (auto leaf : topo.leaves_view()) {
    const double v = observed[static_cast<std::size_t>(leaf)];
    if (!std::isfinite(v) || v < 0.0) {
      throw ValueError("invert_nest: observed share of '" + topo.key(leaf) + "' must be finite and >= 0");
    }
    q[static_cast<std::size_t>(leaf)] = v;
  }
  for (std::size_t k = N; k-- > 1;) {
    q[static_cast<std::size_t>(parents[k])] += q[k];
  }
  if (!(q[0] > 0.0)) {
    throw CalibrationDataGapError("no observed shares to calibrate against", costs.region,
                                  topo.key(topo.root()), costs.year);
  }
  for (auto leaf : topo.leaves_view()) {
    const auto i = static_cast<std::size_t>(leaf);
    if (q[i] > 0.0 && !costs.available[i]) {
      throw CalibrationDataGapError("observed alternative has no usable price", costs.region,
                                    topo.key(leaf), costs.year);
    }
  }

  CalibrationResult res;
  res.region = costs.region;
  res.reference_year = costs.year;
  res.preference.assign(N, 1.0);
  res.composite_cost.assign(N, 0.0);
  res.observed_share.assign(N, 0.0);
  res.observed_share[0] = 1.0;

  std::vector<std::uint8_t> available(N, 0);
  std::vector<double> log_cost(N, 0.0);
  for (std::size_t k = N; k-- > 0;) {
    const auto n = static_cast<NodeId>(k);
    if (topo.is_leaf(n)) {
      if (costs.available[k]) {
        available[k] = 1;
        res.composite_cost[k] = costs.cost[k];
        log_cost[k] = std::log(costs.cost[k]);
      }
      continue;
    }
    const double lambda = exponents[k];
    const auto kids = topo.children(n);

    if (q[k] > 0.0) {
      // Reference sibling: largest observed share, lowest NodeId on ties.
      NodeId r = kids.front();
      for (auto c : kids) {
        if (q[static_cast<std::size_t>(c)] > q[static_cast<std::size_t>(r)]) r = c;
      }
      const auto ri = static_cast<std::size_t>(r);
      for (auto c : kids) {
        const auto ci = static_cast<std::size_t>(c);
        res.observed_share[ci] = q[ci] / q[k];
        if (q[ci] > 0.0) {
          res.preference[ci] = std::exp(std::log(q[ci] / q[ri]) + (log_cost[ci] - log_cost[ri]) / lambda);
        } else if (available[ci]) {
          // Floor the share ratio, not the preference, so that a cheap
          // unobserved alternative re-evaluates to a share near the floor.
          res.preference[ci] =
              std::exp(std::log(opts.preference_floor) + (log_cost[ci] - log_cost[ri]) / lambda);
        } else {
          res.preference[ci] = opts.preference_floor;
        }
      }
    }
    // An unobserved sub-nest keeps preference 1 for all of its children.

    double wmax = -std::numeric_limits<double>::infinity();
    for (auto c : kids) {
      const auto ci = static_cast<std::size_t>(c);
      if (!available[ci]) continue;
      wmax = std::max(wmax, std::log(res.preference[ci]) - log_cost[ci] / lambda);
    }
    if (wmax == -std::numeric_limits<double>::infinity()) {
      EDGETRP_LOG_DEBUG("calibration: '{}' in {} ({}) has no priced alternative",
                        topo.key(n), costs.region, costs.year);
      continue;
    }
    double sum = 0.0;
    for (auto c : kids) {
      const auto ci = static_cast<std::size_t>(c);
      if (!available[ci]) continue;
      sum += std::exp(std::log(res.preference[ci]) - log_cost[ci] / lambda - wmax);
    }
    available[k] = 1;
    log_cost[k] = -lambda * (wmax + std::log(sum));
    res.composite_cost[k] = std::exp(log_cost[k]);
  }
  res.preference[0] = 1.0;
  return res;
}

namespace {
class NestInversionCalibrator : public Calibrator {
public:
  explicit NestInversionCalibrator(CalibrationOptions opts) : opts_(opts) {}

  CalibrationResult calibrate(
      const NestTopology& topo,
      const ObservedShareTable& observed,
      const PriceTable& prices,
      const ValueOfTimeTable& vot,
      const std::string& region,
      Year reference_year) const override {
    auto adjustment = leaf_adjustment(topo, region, reference_year);
    LeafCosts costs;
    try {
      costs = gather_leaf_costs(topo, prices, vot, region, reference_year, adjustment, opts_.evaluation);
    } catch (const MissingPriceError& e) {
      throw CalibrationDataGapError("no price record at the reference year", e.region(), e.node(), e.year());
    }
    auto q = observed_leaf_quantities(topo, observed, region, reference_year);
    auto res = invert_nest(topo, costs, q, opts_);
    res.mode = mode();
    res.leaf_adjustment = std::move(adjustment);
    EDGETRP_LOG_DEBUG("calibrated {} nest for {} at {} ({} nodes)",
                      topo.sector(), region, reference_year, topo.num_nodes());
    return res;
  }

protected:
  // Pre-processing hook applied to leaf costs before inversion.
  [[nodiscard]] virtual std::vector<double> leaf_adjustment(
      const NestTopology& topo, const std::string& region, Year year) const = 0;

  CalibrationOptions opts_;
};

class PreferenceCalibrator final : public NestInversionCalibrator {
public:
  using NestInversionCalibrator::NestInversionCalibrator;
  CalibrationMode mode() const noexcept override { return CalibrationMode::PreferenceOnly; }

protected:
  std::vector<double> leaf_adjustment(const NestTopology&, const std::string&, Year) const override {
    return {};
  }
};

class InconvenienceCalibrator final : public NestInversionCalibrator {
public:
  InconvenienceCalibrator(CalibrationOptions opts, std::shared_ptr<const CostAdjustmentTable> table)
    : NestInversionCalibrator(opts), table_(std::move(table)) {}
  CalibrationMode mode() const noexcept override { return CalibrationMode::Inconvenience; }

protected:
  std::vector<double> leaf_adjustment(const NestTopology& topo, const std::string& region,
                                      Year year) const override {
    std::vector<double> adj(static_cast<std::size_t>(topo.num_nodes()), 0.0);
    for (auto leaf : topo.leaves_view()) {
      auto v = table_->find(region, topo.vehicle_type(leaf), topo.technology(leaf), year);
      if (!v) {
        EDGETRP_LOG_TRACE("no inconvenience cost for '{}' in {} ({})", topo.key(leaf), region, year);
        continue;
      }
      adj[static_cast<std::size_t>(leaf)] = *v;
    }
    return adj;
  }

private:
  std::shared_ptr<const CostAdjustmentTable> table_;
};
} // namespace

CalibratorPtr make_calibrator(CalibrationMode mode,
                              CalibrationOptions opts,
                              std::shared_ptr<const CostAdjustmentTable> adjustments) {
  if (mode == CalibrationMode::Inconvenience) {
    if (!adjustments) {
      throw ValueError("make_calibrator: inconvenience mode requires a cost adjustment table");
    }
    return std::make_shared<InconvenienceCalibrator>(opts, std::move(adjustments));
  }
  return std::make_shared<PreferenceCalibrator>(opts);
}

} // namespace edgetrp::core
