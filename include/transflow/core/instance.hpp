/* Node / Edge records of a transportation instance and small helpers. */
#pragma once

#include <span>
#include <string>
#include <string_view>

#include "transflow/core/constants.hpp"
#include "transflow/core/types.hpp"

namespace transflow::core {

enum class NodeKind {
  Producer = 1,      // supply > 0
  Consumer = 2,      // supply < 0
  Intermediate = 3   // supply == 0 (pass-through)
};

// A node with dense id (0..n-1) and signed supply. Never mutated by the solver.
struct Node {
  NodeId id { 0 };
  Supply supply { 0 };

  [[nodiscard]] bool is_producer() const noexcept { return supply > 0; }
  [[nodiscard]] bool is_consumer() const noexcept { return supply < 0; }
  [[nodiscard]] bool is_intermediate() const noexcept { return supply == 0; }
};

// A directed edge source -> target. The solver only writes `transported`.
struct Edge {
  NodeId source { 0 };
  NodeId target { 0 };
  Flow transported { kUnassigned };

  [[nodiscard]] bool is_assigned() const noexcept { return transported >= 0; }
  [[nodiscard]] EdgeKey key() const noexcept { return EdgeKey{source, target}; }
};

[[nodiscard]] NodeKind node_kind(const Node& n) noexcept;
[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

// Sum of positive supplies.
[[nodiscard]] Supply total_supply(std::span<const Node> nodes) noexcept;
// Sum of absolute negative supplies.
[[nodiscard]] Supply total_demand(std::span<const Node> nodes) noexcept;
// Signed sum of all supplies; zero for a balanced instance.
[[nodiscard]] Supply supply_imbalance(std::span<const Node> nodes) noexcept;

// Human-readable listing: "Nodes:" then "Edges:" sections.
[[nodiscard]] std::string format_graph(std::span<const Node> nodes,
                                       std::span<const Edge> edges);

} // namespace transflow::core
