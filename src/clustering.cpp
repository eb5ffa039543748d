/*
  Deterministic 1-D k-means by dynamic programming.

  Distinct indicator values x_1 < ... < x_m with multiplicities w_i are split
  into k contiguous groups minimising the weighted within-group sum of
  squares. D[j][i] is the optimal cost of the first i values in j groups;
  segment costs come from prefix sums in O(1).
*/
#include "edgetrp/core/clustering.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace edgetrp::core {

namespace {
class TableIndicatorSource final : public IndicatorSource {
public:
  explicit TableIndicatorSource(std::map<std::string, double> values) : values_(std::move(values)) {}

  std::optional<double> indicator(const std::string& region) const override {
    auto it = values_.find(region);
    if (it == values_.end()) return std::nullopt;
    return it->second;
  }

private:
  std::map<std::string, double> values_;
};

// Weighted sum of squared deviations of values [a, b) from their mean.
struct SegmentCost {
  std::vector<double> w, wx, wxx; // prefix sums, length m+1

  double operator()(std::size_t a, std::size_t b) const noexcept {
    const double sw = w[b] - w[a];
    if (sw <= 0.0) return 0.0;
    const double sx = wx[b] - wx[a];
    const double c = (wxx[b] - wxx[a]) - sx * sx / sw;
    return c > 0.0 ? c : 0.0;
  }
  double mean(std::size_t a, std::size_t b) const noexcept {
    return (wx[b] - wx[a]) / (w[b] - w[a]);
  }
};
} // namespace

IndicatorSourcePtr make_table_indicator_source(std::map<std::string, double> values) {
  return std::make_shared<TableIndicatorSource>(std::move(values));
}

int ClusterAssignment::cluster(const std::string& region) const {
  auto it = cluster_of.find(region);
  if (it == cluster_of.end()) {
    throw ValueError("ClusterAssignment: region '" + region + "' was not clustered");
  }
  return it->second;
}

ClusterAssignment assign_clusters(std::span<const std::string> regions,
                                  const IndicatorSource& source,
                                  ClusteringOptions opts) {
  if (opts.num_clusters < 1) {
    throw ValueError("assign_clusters: num_clusters must be >= 1");
  }
  ClusterAssignment out;
  if (regions.empty()) return out;

  // Transformed indicator per region; std::map keeps the distinct values sorted.
  std::map<std::string, double> value_of;
  std::map<double, double> weight_of;
  for (const auto& r : regions) {
    if (value_of.count(r)) continue;
    auto v = source.indicator(r);
    if (!v || !std::isfinite(*v)) {
      throw ClusteringIndicatorMissingError("no structural indicator for region", r, "", 0);
    }
    double x = *v;
    if (opts.log_transform) {
      if (!(x > 0.0)) {
        throw ValueError("assign_clusters: indicator of '" + r + "' must be > 0 for log transform");
      }
      x = std::log(x);
    }
    value_of.emplace(r, x);
    weight_of[x] += 1.0;
  }

  const std::size_t m = weight_of.size();
  const std::size_t k = std::min<std::size_t>(static_cast<std::size_t>(opts.num_clusters), m);
  if (k < static_cast<std::size_t>(opts.num_clusters)) {
    EDGETRP_LOG_WARN("clustering: only {} distinct indicator values, using {} clusters instead of {}",
                     m, k, opts.num_clusters);
  }

  std::vector<double> xs;
  xs.reserve(m);
  SegmentCost seg;
  seg.w.assign(m + 1, 0.0);
  seg.wx.assign(m + 1, 0.0);
  seg.wxx.assign(m + 1, 0.0);
  std::size_t i = 0;
  for (const auto& [x, w] : weight_of) {
    xs.push_back(x);
    seg.w[i + 1] = seg.w[i] + w;
    seg.wx[i + 1] = seg.wx[i] + w * x;
    seg.wxx[i + 1] = seg.wxx[i] + w * x * x;
    ++i;
  }

  // D[j][i]: best cost of the first i values in j groups; B[j][i]: start of the last group.
  constexpr double inf = std::numeric_limits<double>::infinity();
  std::vector<std::vector<double>> D(k + 1, std::vector<double>(m + 1, inf));
  std::vector<std::vector<std::size_t>> B(k + 1, std::vector<std::size_t>(m + 1, 0));
  D[0][0] = 0.0;
  for (std::size_t j = 1; j <= k; ++j) {
    for (std::size_t e = j; e <= m; ++e) {
      for (std::size_t s = j - 1; s < e; ++s) {
        if (D[j - 1][s] == inf) continue;
        const double c = D[j - 1][s] + seg(s, e);
        // Strict comparison keeps the earliest split on ties.
        if (c < D[j][e]) {
          D[j][e] = c;
          B[j][e] = s;
        }
      }
    }
  }

  std::vector<int> group_of_value(m, 0);
  out.num_clusters = static_cast<int>(k);
  out.centers.assign(k, 0.0);
  std::size_t e = m;
  for (std::size_t j = k; j >= 1; --j) {
    const std::size_t s = B[j][e];
    for (std::size_t t = s; t < e; ++t) group_of_value[t] = static_cast<int>(j - 1);
    out.centers[j - 1] = seg.mean(s, e);
    e = s;
  }

  for (const auto& [r, x] : value_of) {
    auto pos = static_cast<std::size_t>(std::lower_bound(xs.begin(), xs.end(), x) - xs.begin());
    out.cluster_of.emplace(r, group_of_value[pos]);
  }
  EDGETRP_LOG_INFO("clustered {} regions into {} clusters", out.cluster_of.size(), out.num_clusters);
  for (const auto& [r, c] : out.cluster_of) {
    EDGETRP_LOG_DEBUG("region {} -> cluster {}", r, c);
  }
  return out;
}

} // namespace edgetrp::core
