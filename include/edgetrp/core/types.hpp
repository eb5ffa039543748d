/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId: int32 (matches np.int32), index into a NestTopology
 * - Year: int32 calendar year
 * - Price/Share/Intensity: double (matches np.float64)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace edgetrp::core {

// Node identifiers are signed 32-bit indices into a compacted topology.
using NodeId = std::int32_t;
using Year   = std::int32_t;
using Price  = double;      // Cost per unit of service (e.g. 1990USD/pkm)
using Share  = double;      // Probability-like value in [0, 1]
using Intensity = double;   // Energy per unit of service (e.g. MJ/km)

inline constexpr NodeId kNoParent = -1;

namespace detail {
// Hash combine formula (similar to Python's hash tuple)
inline void hash_combine(std::size_t& h, std::size_t v) noexcept {
  h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
}
} // namespace detail

// TechYearKey identifies a (region, vehicle_type, technology, year) record.
// Used as a key in unordered_map (like Python dict with custom __hash__).
struct TechYearKey {
  std::string region;
  std::string vehicle_type;
  std::string technology;
  Year year {0};
  friend bool operator==(const TechYearKey& a, const TechYearKey& b) noexcept {
    return a.year == b.year && a.region == b.region &&
           a.vehicle_type == b.vehicle_type && a.technology == b.technology;
  }
};

struct TechYearKeyHash {
  std::size_t operator()(const TechYearKey& k) const noexcept {
    std::size_t h = 0;
    detail::hash_combine(h, std::hash<std::string>{}(k.region));
    detail::hash_combine(h, std::hash<std::string>{}(k.vehicle_type));
    detail::hash_combine(h, std::hash<std::string>{}(k.technology));
    detail::hash_combine(h, std::hash<Year>{}(k.year));
    return h;
  }
};

// VehicleYearKey identifies a (region, vehicle_type, year) record.
struct VehicleYearKey {
  std::string region;
  std::string vehicle_type;
  Year year {0};
  friend bool operator==(const VehicleYearKey& a, const VehicleYearKey& b) noexcept {
    return a.year == b.year && a.region == b.region && a.vehicle_type == b.vehicle_type;
  }
};

struct VehicleYearKeyHash {
  std::size_t operator()(const VehicleYearKey& k) const noexcept {
    std::size_t h = 0;
    detail::hash_combine(h, std::hash<std::string>{}(k.region));
    detail::hash_combine(h, std::hash<std::string>{}(k.vehicle_type));
    detail::hash_combine(h, std::hash<Year>{}(k.year));
    return h;
  }
};

// Calibration variant: preferences alone explain the observed shares, or an
// exogenous inconvenience cost is applied to leaf costs first and the
// preference captures only the residual.
enum class CalibrationMode {
  PreferenceOnly = 1,
  Inconvenience = 2
};

// Shape of the path from an anchor value toward a long-run asymptote.
enum class ConvergenceLaw {
  Logistic = 1,     // S-shaped, slow start and slow finish
  Exponential = 2,  // Fast start, decaying approach
  Linear = 3
};

} // namespace edgetrp::core
