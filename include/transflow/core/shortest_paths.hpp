/* Reduced-cost Dijkstra over a ResidualGraph (Johnson potentials). */
#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "transflow/core/residual_graph.hpp"
#include "transflow/core/types.hpp"

namespace transflow::core {

// Shortest-path tree in reduced costs. For each reached node v != src,
// (prev_node[v], prev_slot[v]) is the arc used to reach v. Unreached nodes
// have dist == kUnreachable and prev_node == -1.
struct ShortestPathTree {
  std::vector<Cost> dist;
  std::vector<NodeId> prev_node;
  std::vector<std::int32_t> prev_slot;

  [[nodiscard]] bool reached(NodeId v) const noexcept;
};

// Dijkstra from src over arcs with positive residual capacity, weighting arc
// (u,v) by cost + potential[u] - potential[v]. Reduced costs must be
// non-negative for every usable arc; a negative one raises RuntimeError.
// Equal distances are settled in discovery order.
[[nodiscard]] ShortestPathTree
reduced_cost_shortest_paths(const ResidualGraph& g, NodeId src,
                            std::span<const Cost> potential);

// Arcs of the tree path src -> dst as (node, slot) pairs, in path order.
// Empty when dst was not reached or dst == src.
[[nodiscard]] std::vector<std::pair<NodeId, std::int32_t>>
resolve_path(const ShortestPathTree& tree, NodeId src, NodeId dst);

} // namespace transflow::core
