/*
  Random instance generator.

  Supplies are drawn with a seeded 64-bit Mersenne Twister so identical
  arguments always yield the same instance. Edges are a prefix of a shuffled
  list of every ordered pair (i, j), i != j, which guarantees a simple
  digraph with exactly num_edges edges.
*/
#include "transflow/core/generator.hpp"
#include "transflow/core/error.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <random>
#include <string>
#include <utility>

namespace transflow::core {

GeneratedGraph generate_random_directed_graph(
    std::int32_t num_nodes, std::int64_t num_edges, std::uint64_t seed,
    std::int64_t supply_range, bool balance_demand) {
  if (num_nodes < 1) {
    throw InvalidInput("num_nodes must be >= 1");
  }
  const auto n = static_cast<std::int64_t>(num_nodes);
  const std::int64_t max_edges = n * (n - 1);
  if (num_edges < 0 || num_edges > max_edges) {
    throw InvalidInput("num_edges must be in [0, " + std::to_string(max_edges) +
                       "] (no self-loops)");
  }
  if (supply_range < 0) {
    throw InvalidInput("supply_range must be >= 0");
  }

  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<std::int64_t> draw(-supply_range, supply_range);

  GeneratedGraph out;
  out.nodes.reserve(static_cast<std::size_t>(num_nodes));
  Supply sum = 0;
  for (std::int32_t i = 0; i + 1 < num_nodes; ++i) {
    Supply s = draw(rng);
    out.nodes.push_back(Node{i, s});
    sum += s;
  }
  // The last node either balances the instance or draws like the others.
  Supply last = balance_demand ? -sum : draw(rng);
  out.nodes.push_back(Node{num_nodes - 1, last});
  out.imbalance = sum + last;
  if (!balance_demand) {
    LOG(INFO) << "supply imbalance is " << out.imbalance;
  }

  std::vector<std::pair<NodeId, NodeId>> pairs;
  pairs.reserve(static_cast<std::size_t>(max_edges));
  for (NodeId i = 0; i < num_nodes; ++i) {
    for (NodeId j = 0; j < num_nodes; ++j) {
      if (i != j) pairs.emplace_back(i, j);
    }
  }
  std::shuffle(pairs.begin(), pairs.end(), rng);
  out.edges.reserve(static_cast<std::size_t>(num_edges));
  for (std::int64_t k = 0; k < num_edges; ++k) {
    auto const& [s, t] = pairs[static_cast<std::size_t>(k)];
    out.edges.push_back(Edge{s, t, kUnassigned});
  }
  VLOG(1) << "generated " << out.nodes.size() << " nodes, " << out.edges.size()
          << " edges (seed " << seed << ")";
  return out;
}

GeneratedGraph generate_random_directed_graph(const GeneratorOptions& opts) {
  return generate_random_directed_graph(opts.num_nodes, opts.num_edges, opts.seed,
                                        opts.supply_range, opts.balance_demand);
}

} // namespace transflow::core
