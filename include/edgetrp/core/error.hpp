/* Exception types raised by the core.
 *
 * Model errors carry the identifying key (region, node, year) of the unit
 * that failed. Node is empty and year is 0 where they do not apply.
 */
#pragma once

#include <stdexcept>
#include <string>

#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ConfigError : public ValueError {
  using ValueError::ValueError;
};

class ModelError : public std::runtime_error {
public:
  ModelError(const std::string& message, std::string region, std::string node, Year year);

  [[nodiscard]] const std::string& region() const noexcept { return region_; }
  [[nodiscard]] const std::string& node() const noexcept { return node_; }
  [[nodiscard]] Year year() const noexcept { return year_; }

private:
  std::string region_;
  std::string node_;
  Year year_ {0};
};

// A leaf required by the caller has no price record for the region/year.
struct MissingPriceError : public ModelError {
  using ModelError::ModelError;
};

// Every alternative under a node that must be chosen from is unavailable.
// Halts processing of the affected region only.
struct DegenerateNestError : public ModelError {
  using ModelError::ModelError;
};

// Calibration cannot be performed because inputs are missing. Fatal.
struct CalibrationDataGapError : public ModelError {
  using ModelError::ModelError;
};

// A vintage cohort reached a negative or NaN quantity. Fatal.
struct FleetIntegrityError : public ModelError {
  using ModelError::ModelError;
};

// A region lacks the structural indicator used for clustering.
struct ClusteringIndicatorMissingError : public ModelError {
  using ModelError::ModelError;
};

} // namespace edgetrp::core
