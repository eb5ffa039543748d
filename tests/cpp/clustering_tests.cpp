#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "edgetrp/core/clustering.hpp"
#include "edgetrp/core/error.hpp"

using namespace edgetrp::core;

namespace {
// Synthetic indicator lookup that counts its queries.
class FakeIndicators final : public IndicatorSource {
public:
  explicit FakeIndicators(std::map<std::string, double> v) : values_(std::move(v)) {}
  std::optional<double> indicator(const std::string& region) const override {
    ++calls;
    auto it = values_.find(region);
    if (it == values_.end()) return std::nullopt;
    return it->second;
  }
  mutable int calls {0};

private:
  std::map<std::string, double> values_;
};
} // namespace

TEST(Clustering, SeparatesWellSpacedGroupsInIndicatorOrder) {
  auto src = make_table_indicator_source({
      {"CAZ", 4.0}, {"USA", 35.0}, {"REF", 9.0},     // sparse
      {"EUR", 110.0}, {"CHA", 150.0}, {"LAM", 90.0}, // medium
      {"IND", 450.0}, {"JPN", 340.0},                // dense
  });
  std::vector<std::string> regions = {"CAZ", "CHA", "EUR", "IND", "JPN", "LAM", "REF", "USA"};
  ClusteringOptions opts;
  opts.num_clusters = 3;
  opts.log_transform = false;
  auto a = assign_clusters(regions, *src, opts);
  EXPECT_EQ(a.num_clusters, 3);
  EXPECT_EQ(a.cluster("CAZ"), 0);
  EXPECT_EQ(a.cluster("USA"), 0);
  EXPECT_EQ(a.cluster("REF"), 0);
  EXPECT_EQ(a.cluster("LAM"), 1);
  EXPECT_EQ(a.cluster("EUR"), 1);
  EXPECT_EQ(a.cluster("CHA"), 1);
  EXPECT_EQ(a.cluster("JPN"), 2);
  EXPECT_EQ(a.cluster("IND"), 2);
  ASSERT_EQ(a.centers.size(), 3u);
  EXPECT_NEAR(a.centers[0], 16.0, 1e-12);
  EXPECT_LT(a.centers[0], a.centers[1]);
  EXPECT_LT(a.centers[1], a.centers[2]);
}

TEST(Clustering, LogTransformGroupsByOrderOfMagnitude) {
  FakeIndicators src({{"A", 1.0}, {"B", 2.0}, {"C", 100.0}, {"D", 200.0}});
  std::vector<std::string> regions = {"A", "B", "C", "D"};
  ClusteringOptions opts;
  opts.num_clusters = 2;
  auto a = assign_clusters(regions, src, opts);
  EXPECT_EQ(a.cluster("A"), a.cluster("B"));
  EXPECT_EQ(a.cluster("C"), a.cluster("D"));
  EXPECT_NE(a.cluster("A"), a.cluster("C"));
  EXPECT_EQ(src.calls, 4);
}

TEST(Clustering, EqualIndicatorsShareClusterAndCountShrinks) {
  FakeIndicators src({{"A", 5.0}, {"B", 5.0}, {"C", 50.0}});
  std::vector<std::string> regions = {"C", "B", "A", "A"};
  ClusteringOptions opts;
  opts.num_clusters = 3;
  auto a = assign_clusters(regions, src, opts);
  EXPECT_EQ(a.num_clusters, 2);
  EXPECT_EQ(a.cluster("A"), 0);
  EXPECT_EQ(a.cluster("B"), 0);
  EXPECT_EQ(a.cluster("C"), 1);
  EXPECT_EQ(a.cluster_of.size(), 3u);
}

TEST(Clustering, DeterministicAcrossCalls) {
  auto src = make_table_indicator_source({{"R1", 3.0}, {"R2", 7.0}, {"R3", 11.0}, {"R4", 13.0}, {"R5", 40.0}});
  std::vector<std::string> regions = {"R1", "R2", "R3", "R4", "R5"};
  std::vector<std::string> shuffled = {"R4", "R1", "R5", "R3", "R2"};
  auto a = assign_clusters(regions, *src);
  auto b = assign_clusters(shuffled, *src);
  EXPECT_EQ(a.cluster_of, b.cluster_of);
  EXPECT_EQ(a.centers, b.centers);
}

TEST(Clustering, MissingIndicatorRaises) {
  auto src = make_table_indicator_source({{"EUR", 110.0}});
  std::vector<std::string> regions = {"EUR", "SSA"};
  try {
    (void)assign_clusters(regions, *src);
    FAIL() << "expected ClusteringIndicatorMissingError";
  } catch (const ClusteringIndicatorMissingError& e) {
    EXPECT_EQ(e.region(), "SSA");
  }
}

TEST(Clustering, InvalidArguments) {
  auto src = make_table_indicator_source({{"EUR", 0.0}});
  std::vector<std::string> regions = {"EUR"};
  EXPECT_THROW((void)assign_clusters(regions, *src), ValueError); // log of 0
  ClusteringOptions none;
  none.num_clusters = 0;
  EXPECT_THROW((void)assign_clusters(regions, *src, none), ValueError);
  ClusterAssignment empty;
  EXPECT_THROW((void)empty.cluster("EUR"), ValueError);
}
