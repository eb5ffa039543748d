/*
  run_projection: the per-scenario pipeline over all regions.

  Fleet quantities are expressed in service units (the demand series), so
  stock shares times demand give the service delivered by each node and
  multiplying by the stock intensity gives its energy demand.
*/
#include "edgetrp/core/projection.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace edgetrp::core {

namespace {
void check_inputs(const ScenarioConfig& config, const ProjectionInputs& in) {
  if (!in.topology || !in.prices || !in.value_of_time || !in.observed || !in.demand || !in.indicators) {
    throw ValueError("run_projection: topology, prices, value_of_time, observed, demand and "
                     "indicators are required");
  }
  if (config.mode == CalibrationMode::Inconvenience && !in.adjustments) {
    throw ValueError("run_projection: inconvenience mode requires cost adjustments");
  }
  if (in.regions.empty()) {
    throw ValueError("run_projection: no regions to project");
  }
}

NewSalesInput new_sales_input(const NestTopology& topo, const LeafCosts& costs,
                              const NestEvaluation& ev, double demand) {
  const auto N = static_cast<std::size_t>(topo.num_nodes());
  NewSalesInput ns;
  ns.year = costs.year;
  ns.demand = demand;
  ns.share = ev.absolute_share;
  ns.price.assign(N, 0.0);
  ns.intensity.assign(N, 0.0);
  for (auto leaf : topo.leaves_view()) {
    const auto i = static_cast<std::size_t>(leaf);
    if (!costs.available[i]) continue;
    ns.price[i] = costs.monetary_cost[i];
    ns.intensity[i] = costs.intensity[i];
  }
  return ns;
}

void fill_energy(const NestTopology& topo, YearResult& yr) {
  const auto N = static_cast<std::size_t>(topo.num_nodes());
  yr.service.assign(N, 0.0);
  yr.energy.assign(N, 0.0);
  for (std::size_t k = 0; k < N; ++k) {
    yr.service[k] = yr.demand * yr.stock.stock_share[k];
    yr.energy[k] = yr.service[k] * yr.stock.stock_intensity[k];
  }
  for (auto leaf : topo.leaves_view()) {
    yr.energy_by_carrier[carrier_of(topo, leaf)] += yr.energy[static_cast<std::size_t>(leaf)];
  }
}

void record_failure(RegionProjection& rp, const ModelError& e) {
  EDGETRP_LOG_ERROR("region {} halted at {}: {}", rp.region, e.year(), e.what());
  rp.failure = e.what();
  rp.failed_year = e.year();
}
} // namespace

const std::string& carrier_of(const NestTopology& topo, NodeId leaf) {
  const auto& c = topo.carrier(leaf);
  return c.empty() ? topo.technology(leaf) : c;
}

ProjectionResult run_projection(const ScenarioConfig& config, const ProjectionInputs& in) {
  config.validate();
  check_inputs(config, in);
  const NestTopology& topo = *in.topology;

  std::vector<std::string> regions = in.regions;
  std::sort(regions.begin(), regions.end());
  regions.erase(std::unique(regions.begin(), regions.end()), regions.end());

  ProjectionResult out;
  out.scenario = config.name;
  EDGETRP_LOG_INFO("scenario '{}' ({}): {} regions, {} years, {} sector",
                   config.name, to_string(config.mode), regions.size(), config.years.size(), topo.sector());

  // Calibration errors are fatal, so a failure here aborts the run.
  CalibrationOptions calibration = config.calibration;
  calibration.evaluation = config.evaluation;
  auto calibrator = make_calibrator(config.mode, calibration, in.adjustments);
  std::vector<CalibrationResult> calibrations;
  calibrations.reserve(regions.size() * config.reference_years.size());
  for (const auto& region : regions) {
    for (Year ref : config.reference_years) {
      calibrations.push_back(calibrator->calibrate(topo, *in.observed, *in.prices, *in.value_of_time, region, ref));
    }
  }
  EDGETRP_LOG_INFO("calibrated {} region-years", calibrations.size());

  out.clusters = assign_clusters(regions, *in.indicators, config.clustering);

  TrendOptions trend = config.trend;
  trend.inconvenience = config.mode == CalibrationMode::Inconvenience;
  out.preferences = project_preferences(topo, calibrations, out.clusters, config.years, in.targets, trend);

  const VintageTracker tracker(topo, in.survival, config.vintage);
  for (const auto& region : regions) {
    RegionProjection rp;
    rp.region = region;
    rp.cluster = out.clusters.cluster(region);
    for (const auto& c : calibrations) {
      if (c.region == region) rp.calibrations.push_back(c);
    }
    const RegionTrajectory& traj = out.preferences.region(region);

    try {
      for (Year y : config.years) {
        const auto costs = gather_leaf_costs(topo, *in.prices, *in.value_of_time, region, y,
                                             traj.adjustment_at(y), config.evaluation);
        YearResult yr;
        yr.year = y;
        yr.new_sales = evaluate_nest(topo, costs, traj.preference_at(y));
        const auto demand = in.demand->find(region, y);
        if (!demand) {
          throw ValueError("run_projection: no demand for " + region + " in " + std::to_string(y));
        }
        yr.demand = *demand;

        const NewSalesInput ns = new_sales_input(topo, costs, yr.new_sales, yr.demand);
        FleetStep step = rp.years.empty() ? tracker.initialize(region, ns)
                                          : tracker.advance(rp.years.back().fleet, ns);
        yr.stock = std::move(step.summary);
        yr.fleet = std::move(step.state);
        fill_energy(topo, yr);
        rp.years.push_back(std::move(yr));
      }
    } catch (const DegenerateNestError& e) {
      record_failure(rp, e);
    } catch (const MissingPriceError& e) {
      record_failure(rp, e);
    }
    out.regions.emplace(region, std::move(rp));
  }
  EDGETRP_LOG_INFO("scenario '{}' done", config.name);
  return out;
}

} // namespace edgetrp::core
