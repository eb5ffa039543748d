/*
  Nested share evaluation over a NestTopology.

  Bottom-up pass (descending NodeId): each available internal node gets the
  inclusive value of its available children,
      C_n = (sum_i p_i * C_i^(-1/lambda_n))^(-lambda_n),
  evaluated in log space with a max shift (log-sum-exp) so that sharp
  exponents do not overflow. The same pass stores the conditional shares
      s_i = p_i * C_i^(-1/lambda_n) / sum_j p_j * C_j^(-1/lambda_n).
  Top-down pass (ascending NodeId): absolute shares are products of
  conditional shares along the path from the root.
*/
#include "edgetrp/core/share_evaluator.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace edgetrp::core {

LeafCosts gather_leaf_costs(const NestTopology& topo,
                            const PriceTable& prices,
                            const ValueOfTimeTable& vot,
                            const std::string& region, Year year,
                            std::span<const double> leaf_adjustment,
                            EvaluationOptions opts) {
  const auto N = static_cast<std::size_t>(topo.num_nodes());
  if (!leaf_adjustment.empty() && leaf_adjustment.size() != N) {
    throw ValueError("gather_leaf_costs: leaf_adjustment length must equal num_nodes");
  }
  LeafCosts out;
  out.region = region;
  out.year = year;
  out.cost.assign(N, 0.0);
  out.monetary_cost.assign(N, 0.0);
  out.intensity.assign(N, 0.0);
  out.available.assign(N, 0);

  for (auto leaf : topo.leaves_view()) {
    const auto i = static_cast<std::size_t>(leaf);
    const auto& vt = topo.vehicle_type(leaf);
    const PriceRecord* rec = prices.find(region, vt, topo.technology(leaf), year);
    if (rec == nullptr) {
      if (opts.require_prices) {
        throw MissingPriceError("no price record for leaf", region, topo.key(leaf), year);
      }
      EDGETRP_LOG_DEBUG("excluding '{}' in {} ({}): no price record", topo.key(leaf), region, year);
      continue;
    }
    Price monetary = rec->non_fuel_cost + rec->fuel_cost * rec->energy_intensity;
    if (topo.uses_value_of_time()) {
      monetary += vot.find(region, vt, year).value_or(0.0);
    }
    const Price cost = monetary + (leaf_adjustment.empty() ? 0.0 : leaf_adjustment[i]);
    out.monetary_cost[i] = monetary;
    out.intensity[i] = rec->energy_intensity;
    if (!std::isfinite(cost) || !(monetary > 0.0) || !(cost > 0.0)) {
      EDGETRP_LOG_DEBUG("excluding '{}' in {} ({}): non-positive effective cost {}",
                        topo.key(leaf), region, year, cost);
      continue;
    }
    out.cost[i] = cost;
    out.available[i] = 1;
  }
  return out;
}

NestEvaluation evaluate_nest(const NestTopology& topo,
                             const LeafCosts& costs,
                             std::span<const double> preference) {
  const auto N = static_cast<std::size_t>(topo.num_nodes());
  if (costs.cost.size() != N || costs.intensity.size() != N || costs.available.size() != N) {
    throw ValueError("evaluate_nest: leaf cost arrays must have length num_nodes");
  }
  if (preference.size() != N) {
    throw ValueError("evaluate_nest: preference length must equal num_nodes");
  }
  NestEvaluation ev;
  ev.region = costs.region;
  ev.year = costs.year;
  ev.composite_cost.assign(N, 0.0);
  ev.share.assign(N, 0.0);
  ev.absolute_share.assign(N, 0.0);
  ev.intensity.assign(N, 0.0);
  ev.available.assign(N, 0);

  const auto parents = topo.parent_view();
  const auto exponents = topo.exponent_view();
  std::vector<double> log_cost(N, 0.0);
  std::vector<double> weight; // scratch: log-weight per child

  for (std::size_t k = N; k-- > 0;) {
    const auto n = static_cast<NodeId>(k);
    if (topo.is_leaf(n)) {
      if (costs.available[k] && costs.cost[k] > 0.0 && std::isfinite(costs.cost[k])) {
        ev.available[k] = 1;
        ev.composite_cost[k] = costs.cost[k];
        ev.intensity[k] = costs.intensity[k];
        log_cost[k] = std::log(costs.cost[k]);
      } else if (parents[k] != kNoParent) {
        ev.excluded.push_back(n);
      }
      if (parents[k] == kNoParent && !ev.available[k]) {
        throw DegenerateNestError("no available alternative in nest", costs.region, topo.key(n), costs.year);
      }
      continue;
    }
    const double lambda = exponents[k];
    const auto kids = topo.children(n);
    weight.assign(kids.size(), -std::numeric_limits<double>::infinity());
    double wmax = -std::numeric_limits<double>::infinity();
    for (std::size_t j = 0; j < kids.size(); ++j) {
      const auto c = static_cast<std::size_t>(kids[j]);
      if (!ev.available[c]) continue;
      const double p = preference[c];
      if (!(p > 0.0) || !std::isfinite(p)) {
        throw ValueError("evaluate_nest: preference of '" + topo.key(kids[j]) + "' must be finite and > 0");
      }
      weight[j] = std::log(p) - log_cost[c] / lambda;
      wmax = std::max(wmax, weight[j]);
    }
    if (wmax == -std::numeric_limits<double>::infinity()) {
      // No available child: drop this node from its parent's choice set.
      if (parents[k] == kNoParent) {
        throw DegenerateNestError("no available alternative in nest", costs.region, topo.key(n), costs.year);
      }
      EDGETRP_LOG_WARN("dropping '{}' in {} ({}): all alternatives unavailable",
                       topo.key(n), costs.region, costs.year);
      ev.excluded.push_back(n);
      continue;
    }
    double sum = 0.0;
    for (std::size_t j = 0; j < kids.size(); ++j) {
      if (std::isfinite(weight[j])) sum += std::exp(weight[j] - wmax);
    }
    double intensity = 0.0;
    for (std::size_t j = 0; j < kids.size(); ++j) {
      if (!std::isfinite(weight[j])) continue;
      const auto c = static_cast<std::size_t>(kids[j]);
      ev.share[c] = std::exp(weight[j] - wmax) / sum;
      intensity += ev.share[c] * ev.intensity[c];
    }
    log_cost[k] = -lambda * (wmax + std::log(sum));
    ev.composite_cost[k] = std::exp(log_cost[k]);
    ev.intensity[k] = intensity;
    ev.available[k] = 1;
  }

  ev.share[0] = 1.0;
  ev.absolute_share[0] = 1.0;
  for (std::size_t k = 1; k < N; ++k) {
    const auto p = static_cast<std::size_t>(parents[k]);
    ev.absolute_share[k] = ev.available[k] ? ev.absolute_share[p] * ev.share[k] : 0.0;
  }
  std::sort(ev.excluded.begin(), ev.excluded.end());
  return ev;
}

NestEvaluation evaluate_shares(const NestTopology& topo,
                               const PriceTable& prices,
                               const ValueOfTimeTable& vot,
                               std::span<const double> preference,
                               const std::string& region, Year year,
                               std::span<const double> leaf_adjustment,
                               EvaluationOptions opts) {
  auto costs = gather_leaf_costs(topo, prices, vot, region, year, leaf_adjustment, opts);
  return evaluate_nest(topo, costs, preference);
}

} // namespace edgetrp::core
