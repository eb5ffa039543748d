#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "edgetrp/core/calibrator.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/preference_trend.hpp"
#include "test_utils.hpp"

using namespace edgetrp::core;
using namespace edgetrp::core::test;

namespace {
CalibrationResult synthetic_calibration(const NestTopology& t, const std::string& region, Year ref,
                                        double base = 0.5) {
  CalibrationResult c;
  c.region = region;
  c.reference_year = ref;
  c.preference.assign(static_cast<std::size_t>(t.num_nodes()), base);
  c.preference[0] = 1.0;
  c.composite_cost.assign(static_cast<std::size_t>(t.num_nodes()), 1.0);
  c.observed_share.assign(static_cast<std::size_t>(t.num_nodes()), 0.0);
  return c;
}

const std::vector<Year> kYears = {2005, 2010, 2020, 2030, 2050, 2070, 2100, 2150};
} // namespace

TEST(ConvergenceWeight, EndPointsAndMonotonicity) {
  for (auto law : {ConvergenceLaw::Logistic, ConvergenceLaw::Exponential, ConvergenceLaw::Linear}) {
    EXPECT_DOUBLE_EQ(convergence_weight(law, 5.0, 2010, 2100, 2000), 1.0);
    EXPECT_DOUBLE_EQ(convergence_weight(law, 5.0, 2010, 2100, 2010), 1.0);
    EXPECT_DOUBLE_EQ(convergence_weight(law, 5.0, 2010, 2100, 2100), 0.0);
    EXPECT_DOUBLE_EQ(convergence_weight(law, 5.0, 2010, 2100, 2150), 0.0);
    double prev = 1.0;
    for (Year y = 2011; y < 2100; ++y) {
      const double w = convergence_weight(law, 5.0, 2010, 2100, y);
      EXPECT_LE(w, prev) << "law " << static_cast<int>(law) << " year " << y;
      EXPECT_GE(w, 0.0);
      EXPECT_LE(w, 1.0);
      prev = w;
    }
  }
  EXPECT_NEAR(convergence_weight(ConvergenceLaw::Linear, 1.0, 2000, 2100, 2050), 0.5, 1e-12);
  EXPECT_NEAR(convergence_weight(ConvergenceLaw::Logistic, 8.0, 2000, 2100, 2050), 0.5, 1e-12);
  // Exponential decays fastest early on.
  EXPECT_LT(convergence_weight(ConvergenceLaw::Exponential, 5.0, 2000, 2100, 2020),
            convergence_weight(ConvergenceLaw::Linear, 5.0, 2000, 2100, 2020));
  EXPECT_THROW((void)convergence_weight(ConvergenceLaw::Logistic, 0.0, 2010, 2100, 2050), ValueError);
  EXPECT_NO_THROW((void)convergence_weight(ConvergenceLaw::Linear, 0.0, 2010, 2100, 2050));
}

TEST(ConvergenceWeight, TinyRatesBehaveLinearly) {
  for (auto law : {ConvergenceLaw::Logistic, ConvergenceLaw::Exponential}) {
    for (double rate : {1e-300, 1e-17, 1e-13, 1e-9}) {
      for (Year y : {2020, 2055, 2090}) {
        const double w = convergence_weight(law, rate, 2010, 2100, y);
        ASSERT_TRUE(std::isfinite(w)) << "law " << static_cast<int>(law) << " rate " << rate;
        EXPECT_NEAR(w, 1.0 - (y - 2010) / 90.0, 1e-6) << "law " << static_cast<int>(law) << " rate " << rate;
      }
    }
  }
}

TEST(PreferenceTrend, HoldsWithoutRuleAndConvergesWithRule) {
  auto t = make_passenger_nest();
  std::vector<CalibrationResult> cals = {synthetic_calibration(t, "EUR", 2010)};
  TrendTargets targets;
  targets.add(TrendRule{"Car|BEV", kAllClusters, 2.0, 2100, 5.0, ConvergenceLaw::Logistic});
  auto traj = project_region(t, cals, 0, kYears, targets);

  const auto bev = static_cast<std::size_t>(node(t, "Car|BEV"));
  const auto ice = static_cast<std::size_t>(node(t, "Car|ICE"));
  for (Year y : kYears) {
    EXPECT_DOUBLE_EQ(traj.preference_at(y)[ice], 0.5);
    EXPECT_DOUBLE_EQ(traj.preference_at(y)[0], 1.0);
  }
  EXPECT_DOUBLE_EQ(traj.preference_at(2010)[bev], 0.5);
  EXPECT_NEAR(traj.preference_at(2100)[bev], 2.0, 1e-12);
  EXPECT_NEAR(traj.preference_at(2150)[bev], 2.0, 1e-12);
  double prev = 0.5;
  for (Year y : {2020, 2030, 2050, 2070}) {
    const double p = traj.preference_at(y)[bev];
    EXPECT_GT(p, prev);
    EXPECT_LT(p, 2.0);
    prev = p;
  }
  EXPECT_TRUE(traj.leaf_adjustment.empty());
  EXPECT_TRUE(traj.adjustment_at(2050).empty());
  EXPECT_THROW((void)traj.preference_at(2011), ValueError);
}

TEST(PreferenceTrend, ReferenceYearsInterpolateLogLinearly) {
  auto t = make_passenger_nest();
  std::vector<CalibrationResult> cals = {synthetic_calibration(t, "EUR", 2030, 4.0),
                                         synthetic_calibration(t, "EUR", 2010, 1.0)};
  std::vector<Year> years = {2005, 2010, 2020, 2030};
  auto traj = project_region(t, cals, 0, years, TrendTargets{});
  const auto car = static_cast<std::size_t>(node(t, "Car"));
  EXPECT_DOUBLE_EQ(traj.preference_at(2005)[car], 1.0);
  EXPECT_DOUBLE_EQ(traj.preference_at(2010)[car], 1.0);
  EXPECT_NEAR(traj.preference_at(2020)[car], 2.0, 1e-12); // geometric midpoint
  EXPECT_NEAR(traj.preference_at(2030)[car], 4.0, 1e-12);
}

TEST(PreferenceTrend, ClusterSpecificRuleWins) {
  auto t = make_passenger_nest();
  std::vector<CalibrationResult> cals = {synthetic_calibration(t, "EUR", 2010)};
  TrendTargets targets;
  targets.add(TrendRule{"Bus", kAllClusters, 0.1, 2050, 5.0, ConvergenceLaw::Linear});
  targets.add(TrendRule{"Bus", 1, 3.0, 2050, 5.0, ConvergenceLaw::Linear});
  const auto bus = static_cast<std::size_t>(node(t, "Bus"));
  auto c0 = project_region(t, cals, 0, kYears, targets);
  auto c1 = project_region(t, cals, 1, kYears, targets);
  EXPECT_NEAR(c0.preference_at(2050)[bus], 0.1, 1e-12);
  EXPECT_NEAR(c1.preference_at(2050)[bus], 3.0, 1e-12);
  ASSERT_NE(targets.find_trend("Bus", 2), nullptr);
  EXPECT_DOUBLE_EQ(targets.find_trend("Bus", 2)->target, 0.1);
  EXPECT_EQ(targets.find_trend("Train", 0), nullptr);
}

TEST(PreferenceTrend, SameClusterSameInputsGiveIdenticalTrajectories) {
  auto t = make_passenger_nest();
  std::vector<CalibrationResult> cals = {synthetic_calibration(t, "DEU", 2010, 0.7),
                                         synthetic_calibration(t, "FRA", 2010, 0.7),
                                         synthetic_calibration(t, "IND", 2010, 0.7)};
  ClusterAssignment clusters;
  clusters.num_clusters = 2;
  clusters.cluster_of = {{"DEU", 0}, {"FRA", 0}, {"IND", 1}};
  TrendTargets targets;
  targets.add(TrendRule{"Car", 0, 0.2, 2100, 4.0, ConvergenceLaw::Logistic});
  targets.add(TrendRule{"Car", 1, 2.0, 2100, 4.0, ConvergenceLaw::Logistic});
  targets.add(TrendRule{"Walk", kAllClusters, 0.05, 2070, 3.0, ConvergenceLaw::Exponential});
  auto proj = project_preferences(t, cals, clusters, kYears, targets);
  ASSERT_EQ(proj.regions.size(), 3u);
  const auto& deu = proj.region("DEU");
  const auto& fra = proj.region("FRA");
  for (Year y : kYears) {
    auto a = deu.preference_at(y);
    auto b = fra.preference_at(y);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t k = 0; k < a.size(); ++k) EXPECT_EQ(a[k], b[k]) << "year " << y << " node " << k;
  }
  const auto car = static_cast<std::size_t>(node(t, "Car"));
  EXPECT_NE(proj.region("IND").preference_at(2100)[car], deu.preference_at(2100)[car]);
  EXPECT_THROW((void)proj.region("USA"), ValueError);
}

TEST(PreferenceTrend, LifestyleAndTechSwitchLevers) {
  auto t = make_passenger_nest();
  std::vector<CalibrationResult> cals = {synthetic_calibration(t, "EUR", 2010)};
  TrendOptions opts;
  opts.smart_lifestyle = true;
  opts.lifestyle_multiplier = 3.0;
  opts.lifestyle_nodes = {"Walk", "Cycle"};
  opts.techswitch = "BEV";
  opts.techswitch_multiplier = 2.0;
  opts.default_convergence_year = 2100;
  TrendTargets targets;
  targets.add(TrendRule{"Walk", kAllClusters, 0.4, 2070, 5.0, ConvergenceLaw::Linear});
  auto traj = project_region(t, cals, 0, kYears, targets, opts);

  // Rule target scaled by the lever
  EXPECT_NEAR(traj.preference_at(2070)[static_cast<std::size_t>(node(t, "Walk"))], 1.2, 1e-12);
  // No rule: the anchor value scaled by the lever, reached at the default year
  EXPECT_NEAR(traj.preference_at(2100)[static_cast<std::size_t>(node(t, "Cycle"))], 1.5, 1e-12);
  EXPECT_NEAR(traj.preference_at(2100)[static_cast<std::size_t>(node(t, "Car|BEV"))], 1.0, 1e-12);
  EXPECT_NEAR(traj.preference_at(2100)[static_cast<std::size_t>(node(t, "Bus|BEV"))], 1.0, 1e-12);
  EXPECT_DOUBLE_EQ(traj.preference_at(2100)[static_cast<std::size_t>(node(t, "Car|ICE"))], 0.5);

  opts.smart_lifestyle = false;
  auto plain = project_region(t, cals, 0, kYears, targets, opts);
  EXPECT_NEAR(plain.preference_at(2070)[static_cast<std::size_t>(node(t, "Walk"))], 0.4, 1e-12);
  EXPECT_DOUBLE_EQ(plain.preference_at(2100)[static_cast<std::size_t>(node(t, "Cycle"))], 0.5);
}

TEST(PreferenceTrend, FlooredNodeStaysAtOrAboveFloorAndEvaluates) {
  auto t = make_passenger_nest();
  auto cal = synthetic_calibration(t, "EUR", 2010);
  const auto fcev = static_cast<std::size_t>(node(t, "Car|FCEV"));
  cal.preference[fcev] = kDefaultPreferenceFloor;
  std::vector<CalibrationResult> cals = {cal};
  TrendTargets targets;
  targets.add(TrendRule{"Car|FCEV", kAllClusters, 1e-14, 2050, 5.0, ConvergenceLaw::Exponential});
  auto traj = project_region(t, cals, 0, kYears, targets);

  PriceTable prices;
  ValueOfTimeTable vot;
  for (Year y : kYears) insert_passenger_prices(prices, vot, "EUR", y);
  for (Year y : kYears) {
    EXPECT_GE(traj.preference_at(y)[fcev], kDefaultPreferenceFloor);
    NestEvaluation ev;
    EXPECT_NO_THROW(ev = evaluate_shares(t, prices, vot, traj.preference_at(y), "EUR", y));
    expect_sibling_shares_sum_to_one(t, ev);
  }
}

TEST(PreferenceTrend, InconvenienceCostsDecayTowardFinalFraction) {
  auto t = make_passenger_nest();
  auto cal = synthetic_calibration(t, "EUR", 2010);
  cal.mode = CalibrationMode::Inconvenience;
  cal.leaf_adjustment.assign(static_cast<std::size_t>(t.num_nodes()), 0.0);
  const auto bev = static_cast<std::size_t>(node(t, "Car|BEV"));
  const auto fcev = static_cast<std::size_t>(node(t, "Car|FCEV"));
  const auto bus_bev = static_cast<std::size_t>(node(t, "Bus|BEV"));
  cal.leaf_adjustment[bev] = 0.3;
  cal.leaf_adjustment[fcev] = 0.5;
  cal.leaf_adjustment[bus_bev] = 0.2;
  std::vector<CalibrationResult> cals = {cal};

  TrendTargets targets;
  // Rule on the Car nest applies to every car leaf; an exact leaf rule wins.
  targets.add(InconvenienceRule{"Car", kAllClusters, 0.2, 2050, 5.0, ConvergenceLaw::Exponential});
  targets.add(InconvenienceRule{"Car|FCEV", kAllClusters, 0.0, 2100, 5.0, ConvergenceLaw::Linear});
  TrendOptions opts;
  opts.inconvenience = true;
  auto traj = project_region(t, cals, 0, kYears, targets, opts);

  ASSERT_EQ(traj.leaf_adjustment.size(), kYears.size());
  EXPECT_DOUBLE_EQ(traj.adjustment_at(2010)[bev], 0.3);
  EXPECT_NEAR(traj.adjustment_at(2050)[bev], 0.06, 1e-12);
  EXPECT_NEAR(traj.adjustment_at(2150)[bev], 0.06, 1e-12);
  EXPECT_GT(traj.adjustment_at(2030)[bev], 0.06);
  EXPECT_LT(traj.adjustment_at(2030)[bev], 0.3);
  EXPECT_NEAR(traj.adjustment_at(2100)[fcev], 0.0, 1e-12);
  EXPECT_NEAR(traj.adjustment_at(2050)[fcev], 0.5 * (1.0 - 40.0 / 90.0), 1e-12);
  // No rule for the bus: held at the anchor value
  EXPECT_DOUBLE_EQ(traj.adjustment_at(2150)[bus_bev], 0.2);
}

TEST(PreferenceTrend, RejectsInvalidInputs) {
  auto t = make_passenger_nest();
  TrendTargets targets;
  std::vector<CalibrationResult> none;
  EXPECT_THROW((void)project_region(t, none, 0, kYears, targets), ValueError);

  std::vector<CalibrationResult> dup = {synthetic_calibration(t, "EUR", 2010), synthetic_calibration(t, "EUR", 2010)};
  EXPECT_THROW((void)project_region(t, dup, 0, kYears, targets), ValueError);

  std::vector<CalibrationResult> mixed = {synthetic_calibration(t, "EUR", 2010), synthetic_calibration(t, "USA", 2015)};
  EXPECT_THROW((void)project_region(t, mixed, 0, kYears, targets), ValueError);

  std::vector<CalibrationResult> one = {synthetic_calibration(t, "EUR", 2010)};
  std::vector<Year> unsorted = {2010, 2030, 2020};
  EXPECT_THROW((void)project_region(t, one, 0, unsorted, targets), ValueError);

  EXPECT_THROW(targets.add(TrendRule{"Car", kAllClusters, 0.0, 2100, 5.0, ConvergenceLaw::Logistic}), ValueError);
  EXPECT_THROW(targets.add(TrendRule{"", kAllClusters, 1.0, 2100, 5.0, ConvergenceLaw::Logistic}), ValueError);
  EXPECT_THROW(targets.add(TrendRule{"Car", -2, 1.0, 2100, 5.0, ConvergenceLaw::Logistic}), ValueError);
  EXPECT_THROW(targets.add(InconvenienceRule{"Car", kAllClusters, -0.5, 2100, 5.0, ConvergenceLaw::Linear}), ValueError);
  EXPECT_EQ(targets.num_trend_rules(), 0u);
}
