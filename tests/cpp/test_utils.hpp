#pragma once

#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>
#include "edgetrp/core/nest_topology.hpp"
#include "edgetrp/core/share_evaluator.hpp"
#include "edgetrp/core/tables.hpp"

namespace edgetrp::core::test {

// Nest builders matching Python fixtures

// root (lambda) -> A (Car, ICE, Liquids), B (Car, BEV, Electricity)
inline NestTopology make_two_leaf_nest(double lambda = 0.5) {
  std::vector<NestNodeSpec> nodes = {
    {"root", "", lambda, "", "", ""},
    {"A", "root", 1.0, "Car", "ICE", "Liquids"},
    {"B", "root", 1.0, "Car", "BEV", "Electricity"},
  };
  return NestTopology::from_nodes("test", nodes, false);
}

// Prices giving effective costs A = 4 + 2*3 = 10 and B = 9 + 1*3 = 12.
inline void insert_two_leaf_prices(PriceTable& prices, const std::string& region, Year year,
                                   double cost_a = 10.0, double cost_b = 12.0) {
  prices.insert(region, "Car", "ICE", year, PriceRecord{cost_a - 6.0, 2.0, 3.0});
  prices.insert(region, "Car", "BEV", year, PriceRecord{cost_b - 3.0, 1.0, 3.0});
}

// passenger (0.6)
//   Walk, Cycle                                   (leaves, lifestyle modes)
//   Car (0.4) -> Car|ICE, Car|BEV, Car|FCEV       (vehicle type "Large Car")
//   Bus (0.5) -> Bus|ICE, Bus|BEV
inline NestTopology make_passenger_nest() {
  std::vector<NestNodeSpec> nodes = {
    {"passenger", "", 0.6, "", "", ""},
    {"Walk", "passenger", 1.0, "Walk", "Walk", ""},
    {"Cycle", "passenger", 1.0, "Cycle", "Cycle", ""},
    {"Car", "passenger", 0.4, "", "", ""},
    {"Bus", "passenger", 0.5, "", "", ""},
    {"Car|ICE", "Car", 1.0, "Large Car", "Liquids", "Liquids"},
    {"Car|BEV", "Car", 1.0, "Large Car", "BEV", "Electricity"},
    {"Car|FCEV", "Car", 1.0, "Large Car", "FCEV", "Hydrogen"},
    {"Bus|ICE", "Bus", 1.0, "Bus", "Liquids", "Liquids"},
    {"Bus|BEV", "Bus", 1.0, "Bus", "BEV", "Electricity"},
  };
  return NestTopology::from_nodes("passenger", nodes, true);
}

// Passenger prices for one region/year; `scale` multiplies non-fuel costs.
inline void insert_passenger_prices(PriceTable& prices, ValueOfTimeTable& vot,
                                    const std::string& region, Year year, double scale = 1.0) {
  prices.insert(region, "Walk", "Walk", year, PriceRecord{0.0, 0.0, 0.0});
  prices.insert(region, "Cycle", "Cycle", year, PriceRecord{0.05 * scale, 0.0, 0.0});
  prices.insert(region, "Large Car", "Liquids", year, PriceRecord{0.25 * scale, 0.02, 2.0});
  prices.insert(region, "Large Car", "BEV", year, PriceRecord{0.35 * scale, 0.03, 0.6});
  prices.insert(region, "Large Car", "FCEV", year, PriceRecord{0.50 * scale, 0.05, 1.0});
  prices.insert(region, "Bus", "Liquids", year, PriceRecord{0.05 * scale, 0.02, 0.5});
  prices.insert(region, "Bus", "BEV", year, PriceRecord{0.07 * scale, 0.03, 0.2});
  vot.insert(region, "Walk", year, 1.2);
  vot.insert(region, "Cycle", year, 0.6);
  vot.insert(region, "Large Car", year, 0.1);
  vot.insert(region, "Bus", year, 0.2);
}

// Observed passenger quantities (FCEV never observed).
inline const std::map<std::pair<std::string, std::string>, double>& passenger_observed() {
  static const std::map<std::pair<std::string, std::string>, double> obs = {
    {{"Walk", "Walk"}, 0.05},
    {{"Cycle", "Cycle"}, 0.02},
    {{"Large Car", "Liquids"}, 0.60},
    {{"Large Car", "BEV"}, 0.03},
    {{"Large Car", "FCEV"}, 0.0},
    {{"Bus", "Liquids"}, 0.28},
    {{"Bus", "BEV"}, 0.02},
  };
  return obs;
}

inline void insert_passenger_observed(ObservedShareTable& observed, const std::string& region,
                                      Year year, double scale = 1.0) {
  for (const auto& [pair, v] : passenger_observed()) {
    observed.insert(region, pair.first, pair.second, year, v * scale);
  }
}

inline NodeId node(const NestTopology& topo, const std::string& key) {
  auto n = topo.find(key);
  EXPECT_TRUE(n.has_value()) << "no node " << key;
  return n.value_or(0);
}

// Assertion helpers
inline void expect_sibling_shares_sum_to_one(const NestTopology& topo, const NestEvaluation& ev,
                                             double tol = 1e-9) {
  for (NodeId n = 0; n < topo.num_nodes(); ++n) {
    if (topo.is_leaf(n) || !ev.available[static_cast<std::size_t>(n)]) continue;
    double sum = 0.0;
    for (auto c : topo.children(n)) sum += ev.share[static_cast<std::size_t>(c)];
    EXPECT_NEAR(sum, 1.0, tol) << "children of '" << topo.key(n) << "' do not sum to 1";
  }
}

inline void expect_csr_valid(const NestTopology& t) {
  auto off = t.child_offsets_view();
  auto kids = t.children_view();
  auto parents = t.parent_view();
  EXPECT_EQ(off.size(), static_cast<std::size_t>(t.num_nodes() + 1));
  for (std::size_t i = 0; i + 1 < off.size(); ++i) {
    EXPECT_LE(off[i], off[i + 1]) << "Child offsets not monotonic at " << i;
  }
  EXPECT_EQ(static_cast<std::size_t>(off.back()), kids.size());
  for (NodeId n = 0; n < t.num_nodes(); ++n) {
    for (auto c : t.children(n)) {
      EXPECT_EQ(parents[static_cast<std::size_t>(c)], n);
      EXPECT_GT(c, n) << "child precedes its parent";
    }
  }
}

} // namespace edgetrp::core::test
