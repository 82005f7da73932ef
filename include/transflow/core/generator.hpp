/* Seeded random instance generator (no self-loops, no duplicate edges). */
#pragma once

#include <cstdint>
#include <vector>

#include "transflow/core/instance.hpp"
#include "transflow/core/types.hpp"

namespace transflow::core {

struct GeneratedGraph {
  std::vector<Node> nodes;
  std::vector<Edge> edges;
  // Signed sum of supplies; always 0 when balancing was requested.
  Supply imbalance { 0 };
};

struct GeneratorOptions {
  std::int32_t num_nodes {1};
  std::int64_t num_edges {0};
  std::uint64_t seed {0};
  std::int64_t supply_range {10};
  bool balance_demand {false};
};

// Generate num_nodes nodes with dense ids and num_edges distinct directed
// edges chosen uniformly among all n*(n-1) ordered pairs. Supplies of the
// first n-1 nodes are uniform in [-supply_range, supply_range]. With
// balance_demand the last node absorbs the remainder so supplies sum to zero
// (its value may fall outside the range); otherwise it draws from the same
// range and the imbalance is logged at INFO level.
// Throws InvalidInput on num_nodes < 1, num_edges outside [0, n*(n-1)] or
// negative supply_range.
[[nodiscard]] GeneratedGraph generate_random_directed_graph(
    std::int32_t num_nodes, std::int64_t num_edges, std::uint64_t seed,
    std::int64_t supply_range = 10, bool balance_demand = false);

[[nodiscard]] GeneratedGraph generate_random_directed_graph(const GeneratorOptions& opts);

} // namespace transflow::core
