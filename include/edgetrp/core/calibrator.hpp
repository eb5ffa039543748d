/*
  Calibrator interface: recovers nest preferences from observed shares.

  Two variants share one closed-form bottom-up inversion and differ only in
  how leaf costs are prepared before inverting:
  - PreferenceOnly: leaf costs are the monetary effective costs.
  - Inconvenience: an exogenous non-price cost adjustment is applied to each
    leaf first, so the solved preference captures only the residual taste.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual ... = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <memory>
#include <span>
#include <string>
#include <vector>

#include "edgetrp/core/nest_topology.hpp"
#include "edgetrp/core/options.hpp"
#include "edgetrp/core/share_evaluator.hpp"
#include "edgetrp/core/tables.hpp"
#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

// Calibrated parameters of one region at one reference year.
// Arrays have length num_nodes(); preference of the root is 1.
struct CalibrationResult {
  std::string region;
  Year reference_year {0};
  CalibrationMode mode {CalibrationMode::PreferenceOnly};
  std::vector<double> preference;
  std::vector<Price> composite_cost;
  std::vector<Share> observed_share;   // conditional observed share among siblings
  std::vector<Price> leaf_adjustment;  // empty in PreferenceOnly mode
};

// Invert the nest: given leaf costs and observed leaf quantities (length
// num_nodes(), non-negative, leaves only), solve every node's preference so
// that evaluate_nest() reproduces the observed shares. The reference sibling
// of each nest (largest observed share, lowest NodeId on ties) is fixed at
// preference 1. Throws CalibrationDataGapError when an observed alternative
// has no usable cost or when nothing is observed.
[[nodiscard]] CalibrationResult invert_nest(const NestTopology& topo,
                                            const LeafCosts& costs,
                                            std::span<const double> observed,
                                            CalibrationOptions opts = {});

// Observed leaf quantities of one region/year as a num_nodes() array.
[[nodiscard]] std::vector<double> observed_leaf_quantities(const NestTopology& topo,
                                                           const ObservedShareTable& observed,
                                                           const std::string& region,
                                                           Year reference_year);

class Calibrator {
public:
  virtual ~Calibrator() noexcept = default;

  [[nodiscard]] virtual CalibrationMode mode() const noexcept = 0;

  [[nodiscard]] virtual CalibrationResult calibrate(
      const NestTopology& topo,
      const ObservedShareTable& observed,
      const PriceTable& prices,
      const ValueOfTimeTable& vot,
      const std::string& region,
      Year reference_year) const = 0;
};

using CalibratorPtr = std::shared_ptr<const Calibrator>;

// adjustments is required for CalibrationMode::Inconvenience and ignored
// otherwise.
[[nodiscard]] CalibratorPtr make_calibrator(
    CalibrationMode mode,
    CalibrationOptions opts = {},
    std::shared_ptr<const CostAdjustmentTable> adjustments = nullptr);

} // namespace edgetrp::core
