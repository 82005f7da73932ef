/*
  successive_shortest_paths — min-cost flow by repeated shortest augmenting
  paths with Johnson potentials, and the transportation solve built on it.

  Each iteration runs a reduced-cost Dijkstra from the source, folds the
  distances into the potentials, and pushes the full bottleneck of the found
  path in one step. After the update, potential[dst] equals the true cost of
  the path, so the cost contribution is bottleneck * potential[dst]. The
  number of iterations is bounded by path count, not by the flow value.
  Cost arithmetic is checked; a total that leaves int64 throws RuntimeError
  before any edge is written.
*/
#include "transflow/core/min_cost_flow.hpp"
#include "transflow/core/checked_math.hpp"
#include "transflow/core/constants.hpp"
#include "transflow/core/error.hpp"
#include "transflow/core/shortest_paths.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace transflow::core {

AugmentResult
successive_shortest_paths(ResidualGraph& g, NodeId src, NodeId dst, Flow target_flow) {
  AugmentResult res;
  const auto N = g.num_nodes();
  if (src < 0 || src >= N || dst < 0 || dst >= N) {
    throw InvalidInput("successive_shortest_paths: src/dst out of range");
  }
  // Zero potentials are valid initially: forward arcs have non-negative cost
  // and reverse arcs start without capacity.
  res.potential.assign(static_cast<std::size_t>(N), 0);
  if (src == dst || target_flow <= 0) return res;

  std::vector<std::pair<Cost, Flow>> cost_dist; // (path cost, flow)
  while (res.flow < target_flow) {
    auto tree = reduced_cost_shortest_paths(g, src, res.potential);
    if (!tree.reached(dst)) break;

    for (std::size_t v = 0; v < tree.dist.size(); ++v) {
      if (tree.dist[v] != kUnreachable) {
        res.potential[v] = checked_add(res.potential[v], tree.dist[v], "potential update");
      }
    }

    auto path = resolve_path(tree, src, dst);
    Flow bottleneck = target_flow - res.flow;
    for (auto const& [u, slot] : path) {
      bottleneck = std::min(bottleneck, g.arc(u, slot).cap);
    }
    for (auto const& [u, slot] : path) {
      g.push(u, slot, bottleneck);
    }

    const Cost path_cost = res.potential[static_cast<std::size_t>(dst)];
    res.flow += bottleneck;
    res.cost = checked_add(res.cost, checked_mul(bottleneck, path_cost, "augment cost"),
                           "total cost");
    ++res.iterations;
    VLOG(2) << "augment #" << res.iterations << ": " << bottleneck
            << " units over " << path.size() << " arcs at cost " << path_cost;

    // Path costs are non-decreasing, so merging with the last entry suffices.
    if (!cost_dist.empty() && cost_dist.back().first == path_cost) {
      cost_dist.back().second += bottleneck;
    } else {
      cost_dist.emplace_back(path_cost, bottleneck);
    }
  }

  res.costs.reserve(cost_dist.size());
  res.flows.reserve(cost_dist.size());
  for (auto const& pr : cost_dist) { res.costs.push_back(pr.first); res.flows.push_back(pr.second); }
  VLOG(1) << "successive_shortest_paths: flow " << res.flow << "/" << target_flow
          << ", cost " << res.cost << ", " << res.iterations << " iterations";
  return res;
}

void map_edge_flows(const ResidualNetwork& net, std::span<Edge> edges) {
  if (net.refs.size() != edges.size()) {
    throw InvalidInput("map_edge_flows: edges do not match the residual network");
  }
  for (std::size_t i = 0; i < edges.size(); ++i) {
    auto const& ref = net.refs[i];
    edges[i].transported = ref.initial_cap - net.graph.arc(ref.owner, ref.slot).cap;
  }
}

TransportSummary solve_transport(std::span<const Node> nodes,
                                 std::span<Edge> edges,
                                 const SolveOptions& opts) {
  // Throws InvalidInput before any edge is written.
  auto net = build_residual_network(nodes, std::span<const Edge>(edges.data(), edges.size()), opts);
  auto& g = net.graph;

  auto aug = successive_shortest_paths(g, g.super_source(), g.super_sink(), net.target_flow);
  map_edge_flows(net, edges);

  TransportSummary summary;
  summary.flow = aug.flow;
  summary.cost = aug.cost;
  summary.total_supply = net.target_flow;
  summary.total_demand = net.total_demand;
  summary.iterations = aug.iterations;
  summary.costs = std::move(aug.costs);
  summary.flows = std::move(aug.flows);
  if (!is_complete(summary)) {
    LOG(WARNING) << "transport instance only partially routed: " << summary.flow
                 << " of " << summary.total_supply << " units";
  }
  return summary;
}

} // namespace transflow::core
