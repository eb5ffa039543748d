/*
  Regional clustering: groups regions into a small number of archetypes by
  one structural indicator (e.g. land-area-normalised density).

  The indicator is supplied through IndicatorSource so that callers can plug
  in any lookup (a table, a database, a synthetic test double).
*/
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "edgetrp/core/options.hpp"

namespace edgetrp::core {

class IndicatorSource {
public:
  virtual ~IndicatorSource() noexcept = default;
  // Structural indicator of the region, or nullopt when unknown.
  [[nodiscard]] virtual std::optional<double> indicator(const std::string& region) const = 0;
};

using IndicatorSourcePtr = std::shared_ptr<const IndicatorSource>;

[[nodiscard]] IndicatorSourcePtr make_table_indicator_source(std::map<std::string, double> values);

// Cluster ids run from 0 to num_clusters-1 in ascending indicator order.
struct ClusterAssignment {
  int num_clusters {0};
  std::map<std::string, int> cluster_of {};
  std::vector<double> centers {}; // mean (transformed) indicator per cluster

  // Throws ValueError for a region that was not clustered.
  [[nodiscard]] int cluster(const std::string& region) const;
};

// Optimal weighted 1-D k-means over the distinct indicator values.
// Deterministic; equal indicators always share a cluster. Throws
// ClusteringIndicatorMissingError for a region without an indicator.
[[nodiscard]] ClusterAssignment assign_clusters(std::span<const std::string> regions,
                                                const IndicatorSource& source,
                                                ClusteringOptions opts = {});

} // namespace edgetrp::core
