/*
  VintageTracker: cohort ageing, new-sales sizing and stock aggregation.
*/
#include "edgetrp/core/vintage_tracker.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace edgetrp::core {

SurvivalSchedule SurvivalSchedule::from_fractions(std::vector<double> fractions) {
  if (fractions.empty()) {
    throw ValueError("SurvivalSchedule: fractions must not be empty");
  }
  if (std::abs(fractions.front() - 1.0) > 1e-12) {
    throw ValueError("SurvivalSchedule: surviving fraction at age 0 must be 1");
  }
  fractions.front() = 1.0;
  for (std::size_t a = 0; a < fractions.size(); ++a) {
    const double f = fractions[a];
    if (!std::isfinite(f) || f < 0.0 || f > 1.0) {
      throw ValueError("SurvivalSchedule: fraction at age " + std::to_string(a) + " must lie in [0, 1]");
    }
    if (a > 0 && f > fractions[a - 1]) {
      throw ValueError("SurvivalSchedule: fractions must be non-increasing in age (age " +
                       std::to_string(a) + ")");
    }
  }
  auto zero = std::find(fractions.begin(), fractions.end(), 0.0);
  if (zero == fractions.end()) {
    throw ValueError("SurvivalSchedule: fractions must reach 0 at the maximum service life");
  }
  fractions.erase(zero + 1, fractions.end());
  return SurvivalSchedule(std::move(fractions));
}

SurvivalSchedule SurvivalSchedule::linear(int service_life) {
  if (service_life < 1) {
    throw ValueError("SurvivalSchedule::linear: service_life must be >= 1");
  }
  std::vector<double> f(static_cast<std::size_t>(service_life) + 1);
  for (int a = 0; a <= service_life; ++a) {
    f[static_cast<std::size_t>(a)] = 1.0 - static_cast<double>(a) / static_cast<double>(service_life);
  }
  f.back() = 0.0;
  return SurvivalSchedule(std::move(f));
}

SurvivalSchedule SurvivalSchedule::logistic(int service_life, double median_age, double steepness) {
  if (service_life < 1) {
    throw ValueError("SurvivalSchedule::logistic: service_life must be >= 1");
  }
  if (!(median_age > 0.0) || !(median_age < service_life)) {
    throw ValueError("SurvivalSchedule::logistic: median_age must lie in (0, service_life)");
  }
  if (!(steepness > 0.0) || !std::isfinite(steepness)) {
    throw ValueError("SurvivalSchedule::logistic: steepness must be finite and > 0");
  }
  auto g = [&](double a) { return 1.0 / (1.0 + std::exp(steepness * (a - median_age))); };
  const double g0 = g(0.0);
  const double gl = g(static_cast<double>(service_life));
  std::vector<double> f(static_cast<std::size_t>(service_life) + 1);
  for (int a = 0; a <= service_life; ++a) {
    f[static_cast<std::size_t>(a)] = std::clamp((g(a) - gl) / (g0 - gl), 0.0, 1.0);
  }
  f.front() = 1.0;
  f.back() = 0.0;
  return SurvivalSchedule(std::move(f));
}

double SurvivalSchedule::fraction(int age) const {
  if (age < 0) {
    throw ValueError("SurvivalSchedule::fraction: age must be >= 0");
  }
  if (age >= max_service_life()) return 0.0;
  return fractions_[static_cast<std::size_t>(age)];
}

void SurvivalTable::set(const std::string& technology, SurvivalSchedule schedule) {
  overrides_.insert_or_assign(technology, std::move(schedule));
}

const SurvivalSchedule& SurvivalTable::schedule(const std::string& technology) const {
  auto it = overrides_.find(technology);
  return it != overrides_.end() ? it->second : default_;
}

FleetState::FleetState(std::string region, Year year, std::vector<Cohort> cohorts)
  : region_(std::move(region)), year_(year), cohorts_(std::move(cohorts)) {
  for (const auto& c : cohorts_) {
    if (!std::isfinite(c.quantity) || c.quantity < 0.0) {
      throw FleetIntegrityError("cohort of leaf " + std::to_string(c.leaf) + " bought in " +
                                std::to_string(c.purchase_year) + " has an invalid quantity",
                                region_, "", year_);
    }
    total_ += c.quantity;
  }
  std::sort(cohorts_.begin(), cohorts_.end(), [](const Cohort& a, const Cohort& b) {
    return a.leaf != b.leaf ? a.leaf < b.leaf : a.purchase_year < b.purchase_year;
  });
}

VintageTracker::VintageTracker(const NestTopology& topo, SurvivalTable survival, VintageOptions opts)
  : topo_(&topo), survival_(std::move(survival)), opts_(opts) {
  if (opts_.initial_vintage_step < 1) {
    throw ValueError("VintageTracker: initial_vintage_step must be >= 1");
  }
}

void VintageTracker::check_input(const std::string& region, const NewSalesInput& input) const {
  const auto N = static_cast<std::size_t>(topo_->num_nodes());
  if (input.share.size() != N || input.price.size() != N || input.intensity.size() != N) {
    throw ValueError("VintageTracker: new-sales arrays must have length num_nodes");
  }
  if (!std::isfinite(input.demand) || input.demand < 0.0) {
    throw FleetIntegrityError("fleet demand must be finite and >= 0", region, "", input.year);
  }
  for (auto leaf : topo_->leaves_view()) {
    const auto i = static_cast<std::size_t>(leaf);
    if (!std::isfinite(input.share[i]) || input.share[i] < 0.0 ||
        !std::isfinite(input.price[i]) || !std::isfinite(input.intensity[i])) {
      throw FleetIntegrityError("non-finite or negative new-sales input", region, topo_->key(leaf), input.year);
    }
  }
}

std::vector<double> VintageTracker::leaf_composition(const std::string& region, const NewSalesInput& input) const {
  double sum = 0.0;
  for (auto leaf : topo_->leaves_view()) sum += input.share[static_cast<std::size_t>(leaf)];
  if (!(sum > 0.0)) {
    throw FleetIntegrityError("new sales required but no leaf has a positive share", region, "", input.year);
  }
  std::vector<double> comp(static_cast<std::size_t>(topo_->num_nodes()), 0.0);
  for (auto leaf : topo_->leaves_view()) {
    const auto i = static_cast<std::size_t>(leaf);
    comp[i] = input.share[i] / sum;
  }
  return comp;
}

StockSummary VintageTracker::summarize(const FleetState& state) const {
  const auto N = static_cast<std::size_t>(topo_->num_nodes());
  StockSummary s;
  s.region = state.region();
  s.year = state.year();
  s.quantity.assign(N, 0.0);
  s.stock_share.assign(N, 0.0);
  s.stock_price.assign(N, 0.0);
  s.stock_intensity.assign(N, 0.0);
  std::vector<double> qp(N, 0.0);
  std::vector<double> qi(N, 0.0);
  for (const auto& c : state.cohorts()) {
    if (c.leaf < 0 || c.leaf >= topo_->num_nodes() || !topo_->is_leaf(c.leaf)) {
      throw ValueError("VintageTracker: cohort refers to a node that is not a leaf");
    }
    const auto i = static_cast<std::size_t>(c.leaf);
    s.quantity[i] += c.quantity;
    qp[i] += c.quantity * c.price;
    qi[i] += c.quantity * c.intensity;
  }
  const auto parents = topo_->parent_view();
  for (std::size_t k = N; k-- > 1;) {
    const auto p = static_cast<std::size_t>(parents[k]);
    s.quantity[p] += s.quantity[k];
    qp[p] += qp[k];
    qi[p] += qi[k];
  }
  s.total_quantity = s.quantity[0];
  for (std::size_t k = 0; k < N; ++k) {
    if (!(s.quantity[k] > 0.0)) continue;
    s.stock_share[k] = s.quantity[k] / s.total_quantity;
    s.stock_price[k] = qp[k] / s.quantity[k];
    s.stock_intensity[k] = qi[k] / s.quantity[k];
  }
  s.fleet_price = s.stock_price[0];
  s.fleet_intensity = s.stock_intensity[0];
  return s;
}

FleetStep VintageTracker::initialize(const std::string& region, const NewSalesInput& base) const {
  check_input(region, base);
  std::vector<Cohort> cohorts;
  if (base.demand > 0.0) {
    const auto comp = leaf_composition(region, base);
    const int spacing = opts_.initial_vintage_step;
    for (auto leaf : topo_->leaves_view()) {
      const auto i = static_cast<std::size_t>(leaf);
      if (!(comp[i] > 0.0)) continue;
      const auto& sched = survival_.schedule(topo_->technology(leaf));
      const int life = sched.max_service_life();
      // Each back-dated cohort stands for `spacing` years of steady sales.
      std::vector<std::pair<int, double>> weights;
      double total_w = 0.0;
      for (int a = 0; a < life; a += spacing) {
        double w = 0.0;
        for (int u = a; u < std::min(a + spacing, life); ++u) w += sched.fraction(u);
        weights.emplace_back(a, w);
        total_w += w;
      }
      const double leaf_q = base.demand * comp[i];
      for (const auto& [age, w] : weights) {
        const double q = leaf_q * w / total_w;
        cohorts.push_back(Cohort{leaf, base.year - age, q / sched.fraction(age), q, base.price[i], base.intensity[i]});
      }
    }
  }
  FleetStep step{FleetState(region, base.year, std::move(cohorts)), {}};
  step.summary = summarize(step.state);
  step.summary.new_sales = step.summary.total_quantity;
  EDGETRP_LOG_DEBUG("initialized fleet of {} at {} with {} cohorts", region, base.year,
                    step.state.cohorts().size());
  return step;
}

FleetStep VintageTracker::advance(const FleetState& prior, const NewSalesInput& input) const {
  const std::string& region = prior.region();
  if (input.year <= prior.year()) {
    throw ValueError("VintageTracker::advance: year " + std::to_string(input.year) +
                     " does not follow fleet year " + std::to_string(prior.year()));
  }
  check_input(region, input);

  std::vector<Cohort> cohorts;
  cohorts.reserve(prior.cohorts().size() + topo_->leaves_view().size());
  double retirements = 0.0;
  double surviving = 0.0;
  for (const auto& c : prior.cohorts()) {
    const auto& sched = survival_.schedule(topo_->technology(c.leaf));
    const double q = c.initial_quantity * sched.fraction(input.year - c.purchase_year);
    if (!std::isfinite(q) || q < 0.0) {
      throw FleetIntegrityError("cohort bought in " + std::to_string(c.purchase_year) +
                                " has an invalid quantity", region, topo_->key(c.leaf), input.year);
    }
    if (q < kMinQuantity) {
      retirements += c.quantity;
      continue;
    }
    retirements += c.quantity - q;
    surviving += q;
    Cohort aged = c;
    aged.quantity = q;
    cohorts.push_back(aged);
  }

  const double new_sales = std::max(0.0, input.demand - surviving);
  if (new_sales > 0.0) {
    const auto comp = leaf_composition(region, input);
    for (auto leaf : topo_->leaves_view()) {
      const auto i = static_cast<std::size_t>(leaf);
      if (!(comp[i] > 0.0)) continue;
      const double q = new_sales * comp[i];
      cohorts.push_back(Cohort{leaf, input.year, q, q, input.price[i], input.intensity[i]});
    }
  }

  FleetStep step{FleetState(region, input.year, std::move(cohorts)), {}};
  step.summary = summarize(step.state);
  step.summary.prior_quantity = prior.total_quantity();
  step.summary.retirements = retirements;
  step.summary.new_sales = new_sales;
  EDGETRP_LOG_TRACE("fleet {} {}: prior {:.6g}, retired {:.6g}, sold {:.6g}", region, input.year,
                    prior.total_quantity(), retirements, new_sales);
  return step;
}

std::vector<FleetStep> run_vintage_fold(const VintageTracker& tracker,
                                        const std::string& region,
                                        std::span<const NewSalesInput> inputs) {
  std::vector<FleetStep> steps;
  steps.reserve(inputs.size());
  for (const auto& in : inputs) {
    if (steps.empty()) {
      steps.push_back(tracker.initialize(region, in));
    } else {
      steps.push_back(tracker.advance(steps.back().state, in));
    }
  }
  return steps;
}

} // namespace edgetrp::core
