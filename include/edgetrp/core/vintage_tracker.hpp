/*
  Vintage stock tracking: an age-structured fleet per region.

  Every year the cohorts bought in earlier years are aged along their
  survival schedule, the gap between the year's demand and the surviving
  fleet is filled with new sales split by the new-sales shares, and the
  fleet is summarised into stock shares and quantity-weighted prices and
  intensities.

  For Python developers:
  - FleetState is an immutable snapshot; advance() returns a new one and
    leaves its input untouched (like a functools.reduce accumulator).
*/
#pragma once

#include <map>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "edgetrp/core/constants.hpp"
#include "edgetrp/core/nest_topology.hpp"
#include "edgetrp/core/options.hpp"
#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

// Surviving fraction by age in whole years. Starts at 1, non-increasing,
// 0 at and after max_service_life().
class SurvivalSchedule {
public:
  // fractions[a] is the surviving fraction at age a. fractions[0] must be
  // 1 and the sequence must reach 0.
  [[nodiscard]] static SurvivalSchedule from_fractions(std::vector<double> fractions);
  // 1 - age / service_life.
  [[nodiscard]] static SurvivalSchedule linear(int service_life);
  // S-shaped decay around median_age, rescaled to 1 at age 0 and 0 at
  // service_life.
  [[nodiscard]] static SurvivalSchedule logistic(int service_life, double median_age, double steepness);

  [[nodiscard]] double fraction(int age) const;
  [[nodiscard]] int max_service_life() const noexcept { return static_cast<int>(fractions_.size()) - 1; }

private:
  explicit SurvivalSchedule(std::vector<double> fractions) : fractions_(std::move(fractions)) {}

  std::vector<double> fractions_ {}; // ages 0..max_service_life, last entry 0
};

// Default schedule plus per-technology overrides.
class SurvivalTable {
public:
  SurvivalTable() : default_(SurvivalSchedule::linear(kDefaultServiceLife)) {}
  explicit SurvivalTable(SurvivalSchedule default_schedule) : default_(std::move(default_schedule)) {}

  void set(const std::string& technology, SurvivalSchedule schedule);
  [[nodiscard]] const SurvivalSchedule& schedule(const std::string& technology) const;
  [[nodiscard]] const SurvivalSchedule& default_schedule() const noexcept { return default_; }

private:
  SurvivalSchedule default_;
  std::map<std::string, SurvivalSchedule> overrides_ {};
};

// Vehicles of one leaf bought in one year. Price and intensity are frozen
// at purchase.
struct Cohort {
  NodeId leaf {0};
  Year purchase_year {0};
  double initial_quantity {0.0};
  double quantity {0.0};
  Price price {0.0};
  Intensity intensity {0.0};
};

// Immutable fleet snapshot of one region at one year. Cohorts are sorted by
// (leaf, purchase_year).
class FleetState {
public:
  FleetState() = default;
  FleetState(std::string region, Year year, std::vector<Cohort> cohorts);

  [[nodiscard]] const std::string& region() const noexcept { return region_; }
  [[nodiscard]] Year year() const noexcept { return year_; }
  [[nodiscard]] std::span<const Cohort> cohorts() const noexcept { return cohorts_; }
  [[nodiscard]] double total_quantity() const noexcept { return total_; }
  [[nodiscard]] bool empty() const noexcept { return cohorts_.empty(); }

private:
  std::string region_ {};
  Year year_ {0};
  std::vector<Cohort> cohorts_ {};
  double total_ {0.0};
};

// Stock-level view of one year. Per-node arrays have length num_nodes();
// internal nodes aggregate their leaves.
struct StockSummary {
  std::string region;
  Year year {0};
  std::vector<double> quantity;          // surviving plus new quantity
  std::vector<Share> stock_share;        // quantity / total fleet
  std::vector<Price> stock_price;        // quantity-weighted
  std::vector<Intensity> stock_intensity;
  double total_quantity {0.0};
  double prior_quantity {0.0};           // fleet of the previous year
  double retirements {0.0};
  double new_sales {0.0};
  Price fleet_price {0.0};
  Intensity fleet_intensity {0.0};
};

// New-sales outcome of one year. Per-node arrays have length num_nodes();
// only leaf entries are read. share holds absolute new-sales shares.
struct NewSalesInput {
  Year year {0};
  double demand {0.0}; // fleet quantity required in this year
  std::vector<Share> share;
  std::vector<Price> price;
  std::vector<Intensity> intensity;
};

struct FleetStep {
  FleetState state;
  StockSummary summary;
};

class VintageTracker {
public:
  // The topology must outlive the tracker.
  VintageTracker(const NestTopology& topo, SurvivalTable survival, VintageOptions opts = {});

  // Seed the first year with a steady-state age structure: the base-year
  // composition spread over back-dated cohorts spaced
  // opts.initial_vintage_step years apart.
  [[nodiscard]] FleetStep initialize(const std::string& region, const NewSalesInput& base) const;

  // Age the fleet to input.year and add the year's new sales. Throws
  // FleetIntegrityError on a negative or NaN quantity or a non-finite input.
  [[nodiscard]] FleetStep advance(const FleetState& prior, const NewSalesInput& input) const;

  [[nodiscard]] StockSummary summarize(const FleetState& state) const;

private:
  void check_input(const std::string& region, const NewSalesInput& input) const;
  [[nodiscard]] std::vector<double> leaf_composition(const std::string& region, const NewSalesInput& input) const;

  const NestTopology* topo_;
  SurvivalTable survival_;
  VintageOptions opts_;
};

// Fold the ordered inputs through the tracker: initialize with the first,
// advance with the rest. Returns one step per input.
[[nodiscard]] std::vector<FleetStep> run_vintage_fold(const VintageTracker& tracker,
                                                      const std::string& region,
                                                      std::span<const NewSalesInput> inputs);

} // namespace edgetrp::core
