#include <gtest/gtest.h>
#include <algorithm>
#include <vector>
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/nest_topology.hpp"
#include "test_utils.hpp"

using namespace edgetrp::core;
using namespace edgetrp::core::test;

TEST(NestTopology, DeterministicLayout) {
  auto t = make_passenger_nest();
  ASSERT_EQ(t.num_nodes(), 10);
  EXPECT_EQ(t.sector(), "passenger");
  EXPECT_TRUE(t.uses_value_of_time());
  EXPECT_EQ(t.key(0), "passenger");
  // Level 1 ordered by key, level 2 by (parent id, key)
  std::vector<std::string> expected = {"passenger", "Bus", "Car", "Cycle", "Walk",
                                       "Bus|BEV", "Bus|ICE", "Car|BEV", "Car|FCEV", "Car|ICE"};
  for (NodeId n = 0; n < t.num_nodes(); ++n) {
    EXPECT_EQ(t.key(n), expected[static_cast<std::size_t>(n)]);
  }
  auto levels = t.level_view();
  EXPECT_EQ(levels[0], 0);
  EXPECT_EQ(levels[1], 1);
  EXPECT_EQ(levels[9], 2);
  expect_csr_valid(t);
}

TEST(NestTopology, LayoutIndependentOfInputOrder) {
  std::vector<NestNodeSpec> nodes = {
    {"Car|ICE", "Car", 1.0, "Large Car", "Liquids", "Liquids"},
    {"Car", "root", 0.4, "", "", ""},
    {"Walk", "root", 1.0, "Walk", "Walk", ""},
    {"root", "", 0.6, "", "", ""},
    {"Car|BEV", "Car", 1.0, "Large Car", "BEV", "Electricity"},
  };
  auto a = NestTopology::from_nodes("p", nodes, false);
  std::reverse(nodes.begin(), nodes.end());
  auto b = NestTopology::from_nodes("p", nodes, false);
  ASSERT_EQ(a.num_nodes(), b.num_nodes());
  for (NodeId n = 0; n < a.num_nodes(); ++n) {
    EXPECT_EQ(a.key(n), b.key(n));
    EXPECT_EQ(a.parent_view()[static_cast<std::size_t>(n)], b.parent_view()[static_cast<std::size_t>(n)]);
  }
}

TEST(NestTopology, LeavesAndLookups) {
  auto t = make_passenger_nest();
  auto leaves = t.leaves_view();
  EXPECT_EQ(leaves.size(), 7u);
  for (auto l : leaves) EXPECT_TRUE(t.is_leaf(l));
  EXPECT_FALSE(t.is_leaf(t.root()));

  auto car = t.find("Car");
  ASSERT_TRUE(car.has_value());
  EXPECT_EQ(t.children(*car).size(), 3u);
  EXPECT_DOUBLE_EQ(t.exponent_view()[static_cast<std::size_t>(*car)], 0.4);

  auto bev = t.find_leaf("Large Car", "BEV");
  ASSERT_TRUE(bev.has_value());
  EXPECT_EQ(t.key(*bev), "Car|BEV");
  EXPECT_EQ(t.carrier(*bev), "Electricity");
  EXPECT_TRUE(t.is_within(*bev, *car));
  EXPECT_TRUE(t.is_within(*bev, t.root()));
  EXPECT_FALSE(t.is_within(*car, *bev));
  EXPECT_FALSE(t.find("Train").has_value());
  EXPECT_FALSE(t.find_leaf("Bus", "FCEV").has_value());
}

TEST(NestTopology, SingleLeafRoot) {
  std::vector<NestNodeSpec> nodes = {{"only", "", 1.0, "Rail", "Electric", "Electricity"}};
  auto t = NestTopology::from_nodes("freight", nodes, false);
  EXPECT_EQ(t.num_nodes(), 1);
  EXPECT_TRUE(t.is_leaf(0));
  EXPECT_EQ(t.leaves_view().size(), 1u);
}

TEST(NestTopologyErrors, RejectsInvalidTables) {
  auto build = [](std::vector<NestNodeSpec> nodes) {
    return NestTopology::from_nodes("p", nodes, false);
  };
  EXPECT_THROW(build({}), ValueError);
  // two roots
  EXPECT_THROW(build({{"a", "", 1.0, "x", "y", ""}, {"b", "", 1.0, "x", "z", ""}}), ValueError);
  // no root (cycle a <-> b)
  EXPECT_THROW(build({{"a", "b", 1.0, "", "", ""}, {"b", "a", 1.0, "", "", ""}}), ValueError);
  // cycle below a root
  EXPECT_THROW(build({{"r", "", 1.0, "", "", ""}, {"l", "r", 1.0, "x", "y", ""},
                      {"a", "b", 1.0, "", "", ""}, {"b", "a", 1.0, "", "", ""}}), ValueError);
  // unknown parent
  EXPECT_THROW(build({{"r", "", 1.0, "", "", ""}, {"a", "missing", 1.0, "x", "y", ""}}), ValueError);
  // duplicate key
  EXPECT_THROW(build({{"r", "", 1.0, "", "", ""}, {"a", "r", 1.0, "x", "y", ""},
                      {"a", "r", 1.0, "x", "z", ""}}), ValueError);
  // non-positive exponent on an internal node
  EXPECT_THROW(build({{"r", "", 0.0, "", "", ""}, {"a", "r", 1.0, "x", "y", ""}}), ValueError);
  // leaf without a technology
  EXPECT_THROW(build({{"r", "", 1.0, "", "", ""}, {"a", "r", 1.0, "x", "", ""}}), ValueError);
  // two leaves for the same (vehicle_type, technology)
  EXPECT_THROW(build({{"r", "", 1.0, "", "", ""}, {"a", "r", 1.0, "x", "y", ""},
                      {"b", "r", 1.0, "x", "y", ""}}), ValueError);
}
