/*
  reduced_cost_shortest_paths — Dijkstra over the residual network.

  Arcs with zero residual capacity are skipped. Arc weights are reduced by
  node potentials (cost + pi[u] - pi[v]) so negative-cost reverse arcs can be
  traversed without losing Dijkstra's correctness. The queue is keyed by
  (distance, discovery sequence): among equally distant nodes the one pushed
  first is settled first, which together with the fixed adjacency layout makes
  every search reproducible.
*/
#include "transflow/core/shortest_paths.hpp"
#include "transflow/core/checked_math.hpp"
#include "transflow/core/constants.hpp"
#include "transflow/core/error.hpp"

#include <algorithm>
#include <cstdint>
#include <queue>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace transflow::core {

bool ShortestPathTree::reached(NodeId v) const noexcept {
  return v >= 0 && static_cast<std::size_t>(v) < dist.size() &&
         dist[static_cast<std::size_t>(v)] != kUnreachable;
}

ShortestPathTree
reduced_cost_shortest_paths(const ResidualGraph& g, NodeId src,
                            std::span<const Cost> potential) {
  const auto N = g.num_nodes();
  if (src < 0 || src >= N) {
    throw InvalidInput("reduced_cost_shortest_paths: src out of range");
  }
  if (potential.size() != static_cast<std::size_t>(N)) {
    throw InvalidInput("reduced_cost_shortest_paths: potential length mismatch");
  }

  ShortestPathTree tree;
  tree.dist.assign(static_cast<std::size_t>(N), kUnreachable);
  tree.prev_node.assign(static_cast<std::size_t>(N), -1);
  tree.prev_slot.assign(static_cast<std::size_t>(N), -1);
  tree.dist[static_cast<std::size_t>(src)] = 0;

  // (distance, discovery sequence, node)
  using QItem = std::tuple<Cost, std::uint64_t, NodeId>;
  auto cmp = [](const QItem& a, const QItem& b) {
    if (std::get<0>(a) != std::get<0>(b)) return std::get<0>(a) > std::get<0>(b);
    return std::get<1>(a) > std::get<1>(b);
  };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  std::uint64_t seq = 0;
  pq.emplace(static_cast<Cost>(0), seq++, src);

  while (!pq.empty()) {
    auto [d_u, order, u] = pq.top(); pq.pop();
    (void)order;
    const auto u_idx = static_cast<std::size_t>(u);
    if (d_u > tree.dist[u_idx]) continue;  // stale entry

    auto out = g.arcs(u);
    for (std::size_t i = 0; i < out.size(); ++i) {
      const ResidualEdge& e = out[i];
      if (e.cap <= 0) continue;
      const auto v_idx = static_cast<std::size_t>(e.to);
      const Cost reduced = checked_sub(checked_add(e.cost, potential[u_idx], "reduced cost"),
                                       potential[v_idx], "reduced cost");
      if (reduced < 0) {
        throw RuntimeError("negative reduced cost " + std::to_string(reduced) +
                           " on arc " + std::to_string(u) + "->" + std::to_string(e.to));
      }
      const Cost nd = checked_add(d_u, reduced, "path distance");
      if (nd < tree.dist[v_idx]) {
        tree.dist[v_idx] = nd;
        tree.prev_node[v_idx] = u;
        tree.prev_slot[v_idx] = static_cast<std::int32_t>(i);
        pq.emplace(nd, seq++, e.to);
      }
    }
  }
  return tree;
}

std::vector<std::pair<NodeId, std::int32_t>>
resolve_path(const ShortestPathTree& tree, NodeId src, NodeId dst) {
  std::vector<std::pair<NodeId, std::int32_t>> path;
  if (src == dst || !tree.reached(dst)) return path;
  for (NodeId v = dst; v != src; v = tree.prev_node[static_cast<std::size_t>(v)]) {
    const auto v_idx = static_cast<std::size_t>(v);
    path.emplace_back(tree.prev_node[v_idx], tree.prev_slot[v_idx]);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

} // namespace transflow::core
