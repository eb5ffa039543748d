/* Nested logit evaluation: composite costs bottom-up, shares top-down. */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "edgetrp/core/nest_topology.hpp"
#include "edgetrp/core/options.hpp"
#include "edgetrp/core/tables.hpp"
#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

// Effective leaf costs of one region and year. Arrays have length
// num_nodes(); entries of internal nodes are unused and left at zero.
struct LeafCosts {
  std::string region;
  Year year {0};
  std::vector<Price> cost;            // generalized cost used by the logit
  std::vector<Price> monetary_cost;   // cost without the non-price adjustment
  std::vector<Intensity> intensity;
  std::vector<std::uint8_t> available; // 0/1 flags
};

// Result of one evaluation. All arrays have length num_nodes().
// - composite_cost: leaf effective cost or inclusive value of the sub-nest
// - share: share of the node among its siblings (root = 1)
// - absolute_share: product of shares along the path from the root
// - intensity: share-weighted energy intensity of the sub-nest
// Unavailable nodes have share 0 and NaN-free zero cost/intensity.
struct NestEvaluation {
  std::string region;
  Year year {0};
  std::vector<Price> composite_cost;
  std::vector<Share> share;
  std::vector<Share> absolute_share;
  std::vector<Intensity> intensity;
  std::vector<std::uint8_t> available;
  std::vector<NodeId> excluded; // nodes dropped from their parent's choice set
};

// Collect effective leaf costs from the input tables. A missing record or a
// non-positive effective cost marks the leaf unavailable (or raises
// MissingPriceError for missing records when opts.require_prices is set).
// leaf_adjustment, when non-empty, has length num_nodes() and is added to
// each leaf's cost (inconvenience cost).
[[nodiscard]] LeafCosts gather_leaf_costs(const NestTopology& topo,
                                          const PriceTable& prices,
                                          const ValueOfTimeTable& vot,
                                          const std::string& region, Year year,
                                          std::span<const double> leaf_adjustment = {},
                                          EvaluationOptions opts = {});

// Evaluate the nest for given leaf costs and per-node preferences
// (length num_nodes(), strictly positive). Throws DegenerateNestError when
// no alternative under the root is available.
[[nodiscard]] NestEvaluation evaluate_nest(const NestTopology& topo,
                                           const LeafCosts& costs,
                                           std::span<const double> preference);

// Convenience: gather_leaf_costs followed by evaluate_nest.
[[nodiscard]] NestEvaluation evaluate_shares(const NestTopology& topo,
                                             const PriceTable& prices,
                                             const ValueOfTimeTable& vot,
                                             std::span<const double> preference,
                                             const std::string& region, Year year,
                                             std::span<const double> leaf_adjustment = {},
                                             EvaluationOptions opts = {});

} // namespace edgetrp::core
