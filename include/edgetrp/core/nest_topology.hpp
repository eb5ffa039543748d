/* Immutable nested-logit decision tree with CSR child adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "edgetrp/core/types.hpp"

namespace edgetrp::core {

// One row of the nest definition table. The root has an empty parent_key.
// Internal nodes carry the logit exponent governing the choice among their
// children; leaves carry the (vehicle_type, technology) pair they stand for
// and optionally the energy carrier used for energy aggregation.
struct NestNodeSpec {
  std::string key;
  std::string parent_key;
  double exponent {1.0};
  std::string vehicle_type;
  std::string technology;
  std::string carrier;
};

// Notes on node identifiers:
// - NodeId refers to the index of a node in the compacted representation.
//   Nodes are deterministically renumbered during construction by
//   (level, parent, key), so ascending NodeId is a valid top-down order and
//   descending NodeId a valid bottom-up order.
// - External node keys are kept for lookup and error reporting.

class NestTopology {
public:
  [[nodiscard]] static NestTopology from_nodes(
      std::string sector,
      std::span<const NestNodeSpec> nodes,
      bool value_of_time);
  ~NestTopology() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(keys_.size()); }
  [[nodiscard]] NodeId root() const noexcept { return 0; }
  [[nodiscard]] const std::string& sector() const noexcept { return sector_; }
  [[nodiscard]] bool uses_value_of_time() const noexcept { return value_of_time_; }

  [[nodiscard]] bool is_leaf(NodeId n) const noexcept {
    return child_offsets_[static_cast<std::size_t>(n)] == child_offsets_[static_cast<std::size_t>(n) + 1];
  }
  [[nodiscard]] const std::string& key(NodeId n) const { return keys_.at(static_cast<std::size_t>(n)); }
  [[nodiscard]] const std::string& vehicle_type(NodeId n) const { return vehicle_types_.at(static_cast<std::size_t>(n)); }
  [[nodiscard]] const std::string& technology(NodeId n) const { return technologies_.at(static_cast<std::size_t>(n)); }
  [[nodiscard]] const std::string& carrier(NodeId n) const { return carriers_.at(static_cast<std::size_t>(n)); }

  [[nodiscard]] std::optional<NodeId> find(std::string_view key) const;
  [[nodiscard]] std::optional<NodeId> find_leaf(std::string_view vehicle_type, std::string_view technology) const;
  // True when `ancestor` lies on the path from n to the root (n included).
  [[nodiscard]] bool is_within(NodeId n, NodeId ancestor) const noexcept;

  [[nodiscard]] std::span<const NodeId> parent_view() const noexcept { return parents_; }
  [[nodiscard]] std::span<const std::int32_t> level_view() const noexcept { return levels_; }
  [[nodiscard]] std::span<const double> exponent_view() const noexcept { return exponents_; }
  [[nodiscard]] std::span<const std::int32_t> child_offsets_view() const noexcept { return child_offsets_; }
  [[nodiscard]] std::span<const NodeId> children_view() const noexcept { return children_; }
  [[nodiscard]] std::span<const NodeId> children(NodeId n) const noexcept {
    auto s = static_cast<std::size_t>(child_offsets_[static_cast<std::size_t>(n)]);
    auto e = static_cast<std::size_t>(child_offsets_[static_cast<std::size_t>(n) + 1]);
    return std::span<const NodeId>(children_).subspan(s, e - s);
  }
  [[nodiscard]] std::span<const NodeId> leaves_view() const noexcept { return leaves_; }

private:
  std::string sector_ {};
  bool value_of_time_ {false};

  std::vector<std::string> keys_ {};
  std::vector<std::string> vehicle_types_ {};
  std::vector<std::string> technologies_ {};
  std::vector<std::string> carriers_ {};
  std::vector<NodeId> parents_ {};
  std::vector<std::int32_t> levels_ {};
  std::vector<double> exponents_ {};

  // CSR child adjacency, children ordered by NodeId
  std::vector<std::int32_t> child_offsets_ {};
  std::vector<NodeId> children_ {};
  std::vector<NodeId> leaves_ {};

  std::unordered_map<std::string, NodeId> index_ {};
  std::unordered_map<std::string, NodeId> leaf_index_ {}; // vehicle_type + '\x1f' + technology
};

} // namespace edgetrp::core
