/*
  ResidualGraph and its builder.

  The builder validates the whole instance first, then lays out arcs in a
  fixed order: original edges in input order, then super-source arcs and
  super-sink arcs in node order. Adjacency order drives tie-breaking among
  equal-cost paths, so the same input always produces the same layout.
*/
#include "transflow/core/residual_graph.hpp"
#include "transflow/core/constants.hpp"
#include "transflow/core/error.hpp"

#include <algorithm>
#include <string>

namespace transflow::core {

ResidualGraph::ResidualGraph(std::int32_t num_original_nodes) {
  if (num_original_nodes < 0) {
    throw InvalidInput("ResidualGraph: num_original_nodes must be >= 0");
  }
  adj_.assign(static_cast<std::size_t>(num_original_nodes) + 2, {});
}

std::int32_t ResidualGraph::add_arc(NodeId u, NodeId v, Cap cap, Cost cost) {
  const auto N = num_nodes();
  if (u < 0 || u >= N || v < 0 || v >= N) {
    throw InvalidInput("ResidualGraph::add_arc: node id out of range");
  }
  if (cap < 0) {
    throw InvalidInput("ResidualGraph::add_arc: capacity must be >= 0");
  }
  auto& out_u = adj_[static_cast<std::size_t>(u)];
  auto& out_v = adj_[static_cast<std::size_t>(v)];
  const auto slot = static_cast<std::int32_t>(out_u.size());
  // For u == v both arcs land in the same list; the reverse sits at slot + 1.
  const auto rev_slot = static_cast<std::int32_t>(out_v.size()) + (u == v ? 1 : 0);
  out_u.push_back(ResidualEdge{v, rev_slot, cap, cost});
  out_v.push_back(ResidualEdge{u, slot, 0, -cost});
  num_arcs_ += 2;
  return slot;
}

void ResidualGraph::push(NodeId u, std::int32_t slot, Flow amount) noexcept {
  ResidualEdge& e = adj_[static_cast<std::size_t>(u)][static_cast<std::size_t>(slot)];
  e.cap -= amount;
  adj_[static_cast<std::size_t>(e.to)][static_cast<std::size_t>(e.rev)].cap += amount;
}

void validate_instance(std::span<const Node> nodes,
                       std::span<const Edge> edges,
                       const SolveOptions& opts) {
  if (nodes.empty()) {
    throw InvalidInput("instance must have at least one node");
  }
  NodeId max_id = -1;
  for (auto const& n : nodes) {
    if (n.id < 0 || n.id > kMaxNodeId) {
      throw InvalidInput("node id must be in [0, " + std::to_string(kMaxNodeId) +
                         "] (got " + std::to_string(n.id) + ")");
    }
    max_id = std::max(max_id, n.id);
  }
  // Arrays are sized by max id; duplicate ids would alias one slot.
  std::vector<NodeId> ids;
  ids.reserve(nodes.size());
  for (auto const& n : nodes) ids.push_back(n.id);
  std::sort(ids.begin(), ids.end());
  auto dup = std::adjacent_find(ids.begin(), ids.end());
  if (dup != ids.end()) {
    throw InvalidInput("duplicate node id " + std::to_string(*dup));
  }
  // Both totals become arc capacities and the flow target, so they share the
  // capacity bound. Checked per node so the running sums cannot overflow.
  Supply supply = 0;
  Supply demand = 0;
  for (auto const& n : nodes) {
    if (n.supply > kUnlimitedCap - supply || n.supply < -(kUnlimitedCap - demand)) {
      throw InvalidInput("total supply and total demand must not exceed kUnlimitedCap (node " +
                         std::to_string(n.id) + ")");
    }
    if (n.supply > 0) supply += n.supply; else demand -= n.supply;
  }
  const auto n = static_cast<std::int64_t>(nodes.size());
  if (static_cast<std::int64_t>(edges.size()) > n * (n - 1)) {
    throw InvalidInput("edge count " + std::to_string(edges.size()) +
                       " exceeds the simple digraph maximum " + std::to_string(n * (n - 1)));
  }
  for (auto const& e : edges) {
    if (e.source < 0 || e.source > max_id || e.target < 0 || e.target > max_id) {
      throw InvalidInput("edge " + std::to_string(e.source) + "->" + std::to_string(e.target) +
                         " references a node id outside [0, " + std::to_string(max_id) + "]");
    }
  }
  for (auto const& [key, cap] : opts.capacities) {
    if (cap < 0) {
      throw InvalidInput("capacity for " + std::to_string(key.source) + "->" +
                         std::to_string(key.target) + " must be >= 0");
    }
    if (cap > kUnlimitedCap) {
      throw InvalidInput("capacity for " + std::to_string(key.source) + "->" +
                         std::to_string(key.target) + " exceeds kUnlimitedCap");
    }
  }
  for (auto const& [key, cost] : opts.costs) {
    if (cost < 0) {
      throw InvalidInput("cost for " + std::to_string(key.source) + "->" +
                         std::to_string(key.target) + " must be >= 0");
    }
  }
}

ResidualNetwork build_residual_network(std::span<const Node> nodes,
                                       std::span<const Edge> edges,
                                       const SolveOptions& opts) {
  validate_instance(nodes, edges, opts);

  NodeId max_id = -1;
  for (auto const& n : nodes) max_id = std::max(max_id, n.id);

  ResidualNetwork net{ResidualGraph(max_id + 1), {}, 0, 0};
  auto& g = net.graph;

  // Original edges first; refs[i] remembers where edges[i]'s forward arc lives.
  net.refs.reserve(edges.size());
  for (auto const& e : edges) {
    auto cap_it = opts.capacities.find(e.key());
    auto cost_it = opts.costs.find(e.key());
    const Cap cap = cap_it != opts.capacities.end() ? cap_it->second : kUnlimitedCap;
    const Cost cost = cost_it != opts.costs.end() ? cost_it->second : kDefaultCost;
    const auto slot = g.add_arc(e.source, e.target, cap, cost);
    net.refs.push_back(EdgeRef{e.source, slot, cap});
  }

  const NodeId ss = g.super_source();
  const NodeId tt = g.super_sink();
  for (auto const& n : nodes) {
    if (n.is_producer()) {
      (void)g.add_arc(ss, n.id, n.supply, 0);
      net.target_flow += n.supply;
    } else if (n.is_consumer()) {
      (void)g.add_arc(n.id, tt, -n.supply, 0);
      net.total_demand += -n.supply;
    }
  }
  return net;
}

} // namespace transflow::core
