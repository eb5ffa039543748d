/* Numerical tolerances and defaults shared across the core. */
#pragma once

namespace edgetrp::core {

// Sibling shares must sum to one within this tolerance.
inline constexpr double kShareTolerance = 1e-9;

// Smallest preference a node can take; keeps zero-share alternatives in the
// choice set so that later price or preference drift can reactivate them.
inline constexpr double kDefaultPreferenceFloor = 1e-10;

// Cohort quantities below this are treated as retired.
inline constexpr double kMinQuantity = 1e-12;

// Service life in years of the default (linear) survival schedule.
inline constexpr int kDefaultServiceLife = 15;

} // namespace edgetrp::core
