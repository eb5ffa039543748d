/*
  NestTopology: immutable nest tree with deterministic layout.

  Construction validates the node table (single root, known parents, no
  cycles, positive exponents on internal nodes, one (vehicle_type,
  technology) pair per leaf), then renumbers nodes level by level, ordered
  by (parent, key) within a level, and compacts children into CSR form.
  With this layout every parent precedes its children.
*/
#include "edgetrp/core/nest_topology.hpp"
#include "edgetrp/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace edgetrp::core {

namespace {
std::string leaf_lookup_key(std::string_view vehicle_type, std::string_view technology) {
  std::string k(vehicle_type);
  k.push_back('\x1f');
  k.append(technology);
  return k;
}
} // namespace

NestTopology NestTopology::from_nodes(
    std::string sector,
    std::span<const NestNodeSpec> nodes,
    bool value_of_time) {

  const std::size_t n = nodes.size();
  if (n == 0) {
    throw ValueError("nest topology must contain at least one node");
  }

  // Resolve parents by key in input order.
  std::unordered_map<std::string, std::size_t> by_key;
  by_key.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (nodes[i].key.empty()) throw ValueError("nest node key must not be empty");
    if (!by_key.emplace(nodes[i].key, i).second) {
      throw ValueError("duplicate nest node key '" + nodes[i].key + "'");
    }
  }
  std::vector<std::int64_t> parent_in(n, -1);
  std::size_t root_in = n;
  for (std::size_t i = 0; i < n; ++i) {
    if (nodes[i].parent_key.empty()) {
      if (root_in != n) {
        throw ValueError("nest has more than one root ('" + nodes[root_in].key + "', '" + nodes[i].key + "')");
      }
      root_in = i;
      continue;
    }
    auto it = by_key.find(nodes[i].parent_key);
    if (it == by_key.end()) {
      throw ValueError("nest node '" + nodes[i].key + "' has unknown parent '" + nodes[i].parent_key + "'");
    }
    parent_in[i] = static_cast<std::int64_t>(it->second);
  }
  if (root_in == n) throw ValueError("nest has no root (a node with empty parent_key)");

  // Levels by walking to the root; a walk longer than n nodes means a cycle.
  std::vector<std::int32_t> level_in(n, -1);
  level_in[root_in] = 0;
  std::vector<std::size_t> chain;
  for (std::size_t i = 0; i < n; ++i) {
    chain.clear();
    std::size_t cur = i;
    while (level_in[cur] < 0) {
      chain.push_back(cur);
      if (chain.size() > n || parent_in[cur] < 0) {
        throw ValueError("nest contains a cycle through node '" + nodes[i].key + "'");
      }
      cur = static_cast<std::size_t>(parent_in[cur]);
    }
    std::int32_t lvl = level_in[cur];
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) level_in[*it] = ++lvl;
  }

  std::vector<std::int32_t> child_count(n, 0);
  for (std::size_t i = 0; i < n; ++i) {
    if (parent_in[i] >= 0) child_count[static_cast<std::size_t>(parent_in[i])]++;
  }
  std::unordered_map<std::string, std::size_t> leaf_pairs;
  for (std::size_t i = 0; i < n; ++i) {
    const auto& spec = nodes[i];
    if (child_count[i] > 0) {
      if (!std::isfinite(spec.exponent) || spec.exponent <= 0.0) {
        throw ValueError("nest node '" + spec.key + "' must have a finite exponent > 0");
      }
      continue;
    }
    if (spec.vehicle_type.empty() || spec.technology.empty()) {
      throw ValueError("leaf '" + spec.key + "' must map to a vehicle_type and a technology");
    }
    if (!leaf_pairs.emplace(leaf_lookup_key(spec.vehicle_type, spec.technology), i).second) {
      throw ValueError("leaf '" + spec.key + "' duplicates the pair (" + spec.vehicle_type + ", " +
                       spec.technology + ")");
    }
  }

  // Renumber level by level; within a level order by (new parent id, key).
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return level_in[a] < level_in[b];
  });
  std::vector<NodeId> new_id(n, kNoParent);
  std::size_t pos = 0;
  while (pos < n) {
    std::size_t end = pos;
    while (end < n && level_in[order[end]] == level_in[order[pos]]) ++end;
    std::sort(order.begin() + static_cast<std::ptrdiff_t>(pos), order.begin() + static_cast<std::ptrdiff_t>(end),
              [&](std::size_t a, std::size_t b) {
                NodeId pa = parent_in[a] < 0 ? kNoParent : new_id[static_cast<std::size_t>(parent_in[a])];
                NodeId pb = parent_in[b] < 0 ? kNoParent : new_id[static_cast<std::size_t>(parent_in[b])];
                if (pa != pb) return pa < pb;
                return nodes[a].key < nodes[b].key;
              });
    for (std::size_t j = pos; j < end; ++j) new_id[order[j]] = static_cast<NodeId>(j);
    pos = end;
  }

  NestTopology t;
  t.sector_ = std::move(sector);
  t.value_of_time_ = value_of_time;
  t.keys_.resize(n);
  t.vehicle_types_.resize(n);
  t.technologies_.resize(n);
  t.carriers_.resize(n);
  t.parents_.resize(n);
  t.levels_.resize(n);
  t.exponents_.resize(n);
  for (std::size_t j = 0; j < n; ++j) {
    const auto& spec = nodes[order[j]];
    t.keys_[j] = spec.key;
    t.vehicle_types_[j] = spec.vehicle_type;
    t.technologies_[j] = spec.technology;
    t.carriers_[j] = spec.carrier;
    t.parents_[j] = parent_in[order[j]] < 0 ? kNoParent : new_id[static_cast<std::size_t>(parent_in[order[j]])];
    t.levels_[j] = level_in[order[j]];
    t.exponents_[j] = spec.exponent;
    t.index_.emplace(spec.key, static_cast<NodeId>(j));
  }

  // Build CSR child adjacency
  t.child_offsets_.assign(n + 1, 0);
  for (std::size_t j = 0; j < n; ++j) {
    if (t.parents_[j] != kNoParent) t.child_offsets_[static_cast<std::size_t>(t.parents_[j]) + 1]++;
  }
  for (std::size_t i = 1; i < t.child_offsets_.size(); ++i) {
    t.child_offsets_[i] += t.child_offsets_[i - 1];
  }
  t.children_.resize(n - 1);
  std::vector<std::int32_t> cursor = t.child_offsets_;
  for (std::size_t j = 0; j < n; ++j) {
    auto p = t.parents_[j];
    if (p == kNoParent) continue;
    auto slot = static_cast<std::size_t>(cursor[static_cast<std::size_t>(p)]++);
    t.children_[slot] = static_cast<NodeId>(j);
  }
  for (std::size_t j = 0; j < n; ++j) {
    if (t.is_leaf(static_cast<NodeId>(j))) {
      t.leaves_.push_back(static_cast<NodeId>(j));
      t.leaf_index_.emplace(leaf_lookup_key(t.vehicle_types_[j], t.technologies_[j]), static_cast<NodeId>(j));
    }
  }
  return t;
}

std::optional<NodeId> NestTopology::find(std::string_view key) const {
  auto it = index_.find(std::string(key));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::optional<NodeId> NestTopology::find_leaf(std::string_view vehicle_type, std::string_view technology) const {
  auto it = leaf_index_.find(leaf_lookup_key(vehicle_type, technology));
  if (it == leaf_index_.end()) return std::nullopt;
  return it->second;
}

bool NestTopology::is_within(NodeId n, NodeId ancestor) const noexcept {
  if (n < 0 || n >= num_nodes() || ancestor < 0 || ancestor >= num_nodes()) return false;
  NodeId cur = n;
  while (cur != kNoParent) {
    if (cur == ancestor) return true;
    cur = parents_[static_cast<std::size_t>(cur)];
  }
  return false;
}

} // namespace edgetrp::core
