/* Successive shortest paths min-cost flow and the transportation solve API. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "transflow/core/instance.hpp"
#include "transflow/core/residual_graph.hpp"
#include "transflow/core/types.hpp"

namespace transflow::core {

struct AugmentResult {
  Flow flow {0};
  Cost cost {0};
  std::int32_t iterations {0};
  // Parallel arrays: flows[i] units were pushed along augmenting paths of
  // true cost costs[i]. Costs are ascending and unique.
  std::vector<Cost> costs;
  std::vector<Flow> flows;
  // Final node potentials (length == g.num_nodes()).
  std::vector<Cost> potential;
};

// Push up to target_flow units from src to dst at minimum cost by repeated
// shortest augmenting paths, mutating g's residual capacities. Stops when
// target_flow is reached or dst becomes unreachable (partial result). Every
// arc usable at entry must have non-negative cost.
[[nodiscard]] AugmentResult
successive_shortest_paths(ResidualGraph& g, NodeId src, NodeId dst, Flow target_flow);

struct TransportSummary {
  Flow flow {0};
  Cost cost {0};
  Flow total_supply {0};
  Flow total_demand {0};
  std::int32_t iterations {0};
  std::vector<Cost> costs;
  std::vector<Flow> flows;
};

// True when every unit of positive supply was routed.
[[nodiscard]] inline bool is_complete(const TransportSummary& s) noexcept {
  return s.flow == s.total_supply;
}

// Write transported = initial capacity - residual capacity of the forward
// arc onto every edge.
void map_edge_flows(const ResidualNetwork& net, std::span<Edge> edges);

// Solve the transportation problem: validates (throws InvalidInput without
// touching any edge), builds the residual network, runs successive shortest
// paths for the total positive supply and maps the result onto edges.
// An infeasible instance yields flow < total_supply, never an exception.
[[nodiscard]] TransportSummary solve_transport(std::span<const Node> nodes,
                                               std::span<Edge> edges,
                                               const SolveOptions& opts = {});

} // namespace transflow::core
