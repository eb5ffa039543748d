#include "edgetrp/core/tables.hpp"

namespace edgetrp::core {

void PriceTable::insert(const std::string& region, const std::string& vehicle_type,
                        const std::string& technology, Year year, PriceRecord record) {
  records_.insert_or_assign(TechYearKey{region, vehicle_type, technology, year}, record);
}

const PriceRecord* PriceTable::find(const std::string& region, const std::string& vehicle_type,
                                    const std::string& technology, Year year) const {
  auto it = records_.find(TechYearKey{region, vehicle_type, technology, year});
  if (it == records_.end()) return nullptr;
  return &it->second;
}

void ValueOfTimeTable::insert(const std::string& region, const std::string& vehicle_type, Year year,
                              Price time_cost) {
  values_.insert_or_assign(VehicleYearKey{region, vehicle_type, year}, time_cost);
}

std::optional<Price> ValueOfTimeTable::find(const std::string& region, const std::string& vehicle_type,
                                            Year year) const {
  auto it = values_.find(VehicleYearKey{region, vehicle_type, year});
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void CostAdjustmentTable::insert(const std::string& region, const std::string& vehicle_type,
                                 const std::string& technology, Year year, Price adjustment) {
  values_.insert_or_assign(TechYearKey{region, vehicle_type, technology, year}, adjustment);
}

std::optional<Price> CostAdjustmentTable::find(const std::string& region, const std::string& vehicle_type,
                                               const std::string& technology, Year year) const {
  auto it = values_.find(TechYearKey{region, vehicle_type, technology, year});
  if (it != values_.end()) return it->second;
  // Fall back to the vehicle-type wide entry
  it = values_.find(TechYearKey{region, vehicle_type, std::string(), year});
  if (it != values_.end()) return it->second;
  return std::nullopt;
}

void ObservedShareTable::insert(const std::string& region, const std::string& vehicle_type,
                                const std::string& technology, Year reference_year, double observed) {
  values_.insert_or_assign(TechYearKey{region, vehicle_type, technology, reference_year}, observed);
}

std::optional<double> ObservedShareTable::find(const std::string& region, const std::string& vehicle_type,
                                               const std::string& technology, Year reference_year) const {
  auto it = values_.find(TechYearKey{region, vehicle_type, technology, reference_year});
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void DemandSeries::insert(const std::string& region, Year year, double demand) {
  values_.insert_or_assign(std::make_pair(region, year), demand);
}

std::optional<double> DemandSeries::find(const std::string& region, Year year) const {
  auto it = values_.find(std::make_pair(region, year));
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

} // namespace edgetrp::core
