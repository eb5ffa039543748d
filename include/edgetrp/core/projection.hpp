/*
  Projection pipeline: calibrate, cluster, project preferences, evaluate the
  nest every year and fold the new-sales outcome into the vintage fleet.
*/
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "edgetrp/core/calibrator.hpp"
#include "edgetrp/core/clustering.hpp"
#include "edgetrp/core/config.hpp"
#include "edgetrp/core/nest_topology.hpp"
#include "edgetrp/core/preference_trend.hpp"
#include "edgetrp/core/share_evaluator.hpp"
#include "edgetrp/core/tables.hpp"
#include "edgetrp/core/vintage_tracker.hpp"

namespace edgetrp::core {

// Everything a run reads. The tables are shared, not copied, so one set of
// inputs can feed several scenarios.
struct ProjectionInputs {
  std::shared_ptr<const NestTopology> topology {};
  std::shared_ptr<const PriceTable> prices {};
  std::shared_ptr<const ValueOfTimeTable> value_of_time {};
  std::shared_ptr<const ObservedShareTable> observed {};
  std::shared_ptr<const CostAdjustmentTable> adjustments {}; // inconvenience mode only
  std::shared_ptr<const DemandSeries> demand {};
  IndicatorSourcePtr indicators {};
  SurvivalTable survival {};
  TrendTargets targets {};
  std::vector<std::string> regions {};
};

struct YearResult {
  Year year {0};
  NestEvaluation new_sales;          // shares, composite costs and intensities of new vehicles
  StockSummary stock;                // vintage-weighted fleet view
  FleetState fleet;                  // cohort snapshot
  double demand {0.0};               // total service demand
  std::vector<double> service;       // per node: demand * stock share
  std::vector<double> energy;        // per node: service * stock intensity
  std::map<std::string, double> energy_by_carrier {};
};

struct RegionProjection {
  std::string region;
  int cluster {0};
  std::vector<CalibrationResult> calibrations;
  std::vector<YearResult> years;
  // Set when a DegenerateNestError or MissingPriceError halted the region;
  // years holds the results computed before the failure.
  std::optional<std::string> failure {};
  Year failed_year {0};
};

struct ProjectionResult {
  std::string scenario;
  ClusterAssignment clusters;
  PreferenceTrajectory preferences;
  std::map<std::string, RegionProjection> regions;
};

// Energy carrier a leaf reports under: its carrier, or its technology when
// no carrier is set.
[[nodiscard]] const std::string& carrier_of(const NestTopology& topo, NodeId leaf);

// Run one scenario. Regions are processed in sorted order. A
// DegenerateNestError or MissingPriceError in a projection year is recorded
// on the region and the run continues; every other error propagates.
// Missing prices at a reference year fail calibration with
// CalibrationDataGapError.
[[nodiscard]] ProjectionResult run_projection(const ScenarioConfig& config, const ProjectionInputs& inputs);

} // namespace edgetrp::core
