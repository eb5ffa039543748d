/* Keyed input tables handed to the core by the ingestion layer. */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

// Monetary inputs of one (region, vehicle_type, technology, year) leaf.
// fuel_cost is per unit of energy; the effective cost per unit of service is
// non_fuel_cost + fuel_cost * energy_intensity.
struct PriceRecord {
  Price non_fuel_cost {0.0};
  Price fuel_cost {0.0};
  Intensity energy_intensity {0.0};
};

class PriceTable {
public:
  void insert(const std::string& region, const std::string& vehicle_type,
              const std::string& technology, Year year, PriceRecord record);
  [[nodiscard]] const PriceRecord* find(const std::string& region, const std::string& vehicle_type,
                                        const std::string& technology, Year year) const;
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

private:
  std::unordered_map<TechYearKey, PriceRecord, TechYearKeyHash> records_;
};

// Time cost per unit of distance for passenger vehicle types.
class ValueOfTimeTable {
public:
  void insert(const std::string& region, const std::string& vehicle_type, Year year, Price time_cost);
  [[nodiscard]] std::optional<Price> find(const std::string& region, const std::string& vehicle_type,
                                          Year year) const;
  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

private:
  std::unordered_map<VehicleYearKey, Price, VehicleYearKeyHash> values_;
};

// Non-price (inconvenience) cost adjustments. An entry with an empty
// technology applies to every technology of its vehicle type; an entry for
// the exact technology takes precedence.
class CostAdjustmentTable {
public:
  void insert(const std::string& region, const std::string& vehicle_type,
              const std::string& technology, Year year, Price adjustment);
  [[nodiscard]] std::optional<Price> find(const std::string& region, const std::string& vehicle_type,
                                          const std::string& technology, Year year) const;
  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

private:
  std::unordered_map<TechYearKey, Price, TechYearKeyHash> values_;
};

// Historical shares (or absolute quantities, normalised per region and year
// by the calibrator) at reference years.
class ObservedShareTable {
public:
  void insert(const std::string& region, const std::string& vehicle_type,
              const std::string& technology, Year reference_year, double observed);
  [[nodiscard]] std::optional<double> find(const std::string& region, const std::string& vehicle_type,
                                           const std::string& technology, Year reference_year) const;
  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

private:
  std::unordered_map<TechYearKey, double, TechYearKeyHash> values_;
};

// Total service demand per (region, year), the supplied demand trajectory.
class DemandSeries {
public:
  void insert(const std::string& region, Year year, double demand);
  [[nodiscard]] std::optional<double> find(const std::string& region, Year year) const;
  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

private:
  std::map<std::pair<std::string, Year>, double> values_;
};

} // namespace edgetrp::core
