/**
 * End-to-end tests for solve_transport.
 *
 * Coverage dimensions:
 * - Reference scenarios: single edge, two producers, stranded producer,
 *   equal-cost alternatives
 * - Properties: conservation, capacity, supply satisfaction, cost correctness
 * - Partial (infeasible) instances and unbalanced supplies
 * - Validation happens before any edge is written
 * - Randomized instances cross-checked against a Bellman-Ford reference
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <utility>
#include <vector>
#include "transflow/core/constants.hpp"
#include "transflow/core/error.hpp"
#include "transflow/core/generator.hpp"
#include "transflow/core/min_cost_flow.hpp"
#include "test_utils.hpp"

using namespace transflow::core;
using namespace transflow::core::test;

namespace {

// Reference min-cost flow: Bellman-Ford shortest paths on an explicit
// residual edge list, no potentials. Returns {flow, cost}.
std::pair<Flow, Cost> reference_min_cost_flow(const Instance& inst) {
  struct Arc { int u, v; Cap cap; Cost cost; };
  NodeId max_id = -1;
  for (auto const& n : inst.nodes) max_id = std::max(max_id, n.id);
  const int n = max_id + 3;
  const int s = n - 2, t = n - 1;
  std::vector<Arc> arcs;
  auto add = [&arcs](int u, int v, Cap cap, Cost cost) {
    arcs.push_back({u, v, cap, cost});
    arcs.push_back({v, u, 0, -cost});
  };
  for (auto const& e : inst.edges) {
    add(e.source, e.target, edge_capacity(inst.opts, e), edge_cost(inst.opts, e));
  }
  Flow want = 0;
  for (auto const& nd : inst.nodes) {
    if (nd.supply > 0) { add(s, nd.id, nd.supply, 0); want += nd.supply; }
    if (nd.supply < 0) add(nd.id, t, -nd.supply, 0);
  }
  Flow flow = 0;
  Cost cost = 0;
  const Cost inf = std::numeric_limits<Cost>::max() / 4;
  while (flow < want) {
    std::vector<Cost> dist(static_cast<std::size_t>(n), inf);
    std::vector<int> via(static_cast<std::size_t>(n), -1);
    dist[static_cast<std::size_t>(s)] = 0;
    for (int round = 0; round < n; ++round) {
      bool changed = false;
      for (std::size_t i = 0; i < arcs.size(); ++i) {
        auto const& a = arcs[i];
        if (a.cap <= 0 || dist[static_cast<std::size_t>(a.u)] == inf) continue;
        Cost nd = dist[static_cast<std::size_t>(a.u)] + a.cost;
        if (nd < dist[static_cast<std::size_t>(a.v)]) {
          dist[static_cast<std::size_t>(a.v)] = nd;
          via[static_cast<std::size_t>(a.v)] = static_cast<int>(i);
          changed = true;
        }
      }
      if (!changed) break;
    }
    if (dist[static_cast<std::size_t>(t)] == inf) break;
    Flow push = want - flow;
    for (int v = t; v != s; v = arcs[static_cast<std::size_t>(via[static_cast<std::size_t>(v)])].u) {
      push = std::min(push, arcs[static_cast<std::size_t>(via[static_cast<std::size_t>(v)])].cap);
    }
    for (int v = t; v != s; v = arcs[static_cast<std::size_t>(via[static_cast<std::size_t>(v)])].u) {
      auto idx = static_cast<std::size_t>(via[static_cast<std::size_t>(v)]);
      arcs[idx].cap -= push;
      arcs[idx ^ 1u].cap += push;
    }
    flow += push;
    cost += push * dist[static_cast<std::size_t>(t)];
  }
  return {flow, cost};
}

} // namespace

//=============================================================================
// SECTION 1: REFERENCE SCENARIOS
//=============================================================================

TEST(SolveTransport, ScenarioA_SingleEdge) {
  Instance inst;
  inst.nodes = make_nodes({5, -5});
  add_edge(inst, 0, 1, 1, 100);
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, 5);
  EXPECT_EQ(s.cost, 5);
  EXPECT_EQ(inst.edges[0].transported, 5);
  EXPECT_TRUE(is_complete(s));
  validate_summary(s, inst.nodes, inst.edges, inst.opts);
}

TEST(SolveTransport, ScenarioB_TwoProducersOneConsumer) {
  Instance inst;
  inst.nodes = make_nodes({3, 2, -5});
  add_edge(inst, 0, 2, 2, 100);
  add_edge(inst, 1, 2, 1, 100);
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, 5);
  EXPECT_EQ(s.cost, 3 * 2 + 2 * 1);
  EXPECT_EQ(inst.edges[0].transported, 3);
  EXPECT_EQ(inst.edges[1].transported, 2);
  validate_supply_satisfied(inst.nodes, inst.edges);
  validate_summary(s, inst.nodes, inst.edges, inst.opts);
}

TEST(SolveTransport, ScenarioC_StrandedProducerYieldsPartialFlow) {
  // Node 2 supplies 4 units but has no outgoing edge at all.
  Instance inst;
  inst.nodes = make_nodes({3, -7, 4});
  add_edge(inst, 0, 1, 1, 100);
  add_edge(inst, 1, 2, 1, 100);
  TransportSummary s;
  ASSERT_NO_THROW(s = solve_transport(inst.nodes, inst.edges, inst.opts));
  EXPECT_EQ(s.total_supply, 7);
  EXPECT_LT(s.flow, s.total_supply);
  EXPECT_EQ(s.flow, 3);
  EXPECT_FALSE(is_complete(s));
  EXPECT_EQ(inst.edges[0].transported, 3);
  EXPECT_EQ(inst.edges[1].transported, 0);
  validate_summary(s, inst.nodes, inst.edges, inst.opts);
}

TEST(SolveTransport, ScenarioD_EqualCostAlternativesSameCost) {
  // Two parallel routes of total cost 4 between producer 0 and consumer 3.
  auto build = [](bool swap_order) {
    Instance inst;
    inst.nodes = make_nodes({6, 0, 0, -6});
    if (swap_order) {
      add_edge(inst, 0, 2, 1, 4);
      add_edge(inst, 2, 3, 3, 4);
      add_edge(inst, 0, 1, 2, 4);
      add_edge(inst, 1, 3, 2, 4);
    } else {
      add_edge(inst, 0, 1, 2, 4);
      add_edge(inst, 1, 3, 2, 4);
      add_edge(inst, 0, 2, 1, 4);
      add_edge(inst, 2, 3, 3, 4);
    }
    return inst;
  };
  auto a = build(false);
  auto b = build(true);
  auto sa = solve_transport(a.nodes, a.edges, a.opts);
  auto sb = solve_transport(b.nodes, b.edges, b.opts);
  EXPECT_EQ(sa.flow, 6);
  EXPECT_EQ(sb.flow, 6);
  EXPECT_EQ(sa.cost, 24);
  EXPECT_EQ(sb.cost, 24);
  validate_summary(sa, a.nodes, a.edges, a.opts);
  validate_summary(sb, b.nodes, b.edges, b.opts);
}

//=============================================================================
// SECTION 2: DEFAULTS, TIERS AND CANCELLATION
//=============================================================================

TEST(SolveTransport, DefaultsAreUnitCostUnlimitedCapacity) {
  std::vector<Node> nodes = {{0, 9}, {1, 0}, {2, -9}};
  std::vector<Edge> edges = {{0, 1}, {1, 2}, {0, 2}};
  auto s = solve_transport(nodes, edges);
  EXPECT_EQ(s.flow, 9);
  EXPECT_EQ(s.cost, 9);
  EXPECT_EQ(edges[2].transported, 9);
  EXPECT_EQ(edges[0].transported, 0);
  EXPECT_EQ(edges[1].transported, 0);
}

TEST(SolveTransport, CheapTierSaturatesFirst) {
  auto inst = make_tiered_instance(10, 4);
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, 10);
  EXPECT_EQ(s.cost, 4 * 2 + 6 * 6);
  EXPECT_EQ(inst.edges[0].transported, 4);
  EXPECT_EQ(inst.edges[2].transported, 6);
  ASSERT_EQ(s.costs.size(), 2u);
  EXPECT_EQ(s.flows[0], 4);
  EXPECT_EQ(s.flows[1], 6);
  validate_summary(s, inst.nodes, inst.edges, inst.opts);
}

TEST(SolveTransport, LargeSupplyUsesFewIterations) {
  auto inst = make_line_instance(5, 1'000'000'000, kUnlimitedCap);
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, 1'000'000'000);
  EXPECT_EQ(s.cost, 4'000'000'000LL);
  EXPECT_EQ(s.iterations, 1);
}

TEST(SolveTransport, ZeroCapacityEdgeCarriesNothing) {
  Instance inst;
  inst.nodes = make_nodes({2, -2});
  add_edge(inst, 0, 1, 1, 0);
  add_edge(inst, 1, 0, 1, 5);
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, 0);
  EXPECT_EQ(s.cost, 0);
  EXPECT_EQ(inst.edges[0].transported, 0);
  EXPECT_EQ(inst.edges[1].transported, 0);
  validate_all_assigned(inst.edges);
}

TEST(SolveTransport, ReroutesWhenEarlyChoiceBlocksLaterSupply) {
  // Producer 0 can reach consumers 2 and 3, producer 1 only consumer 2.
  // The cheapest first choice 0->2 must be undone so 1 can deliver.
  Instance inst;
  inst.nodes = make_nodes({1, 1, -1, -1});
  add_edge(inst, 0, 2, 1, 1);
  add_edge(inst, 0, 3, 2, 1);
  add_edge(inst, 1, 2, 5, 1);
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, 2);
  EXPECT_EQ(s.cost, 2 + 5);
  EXPECT_EQ(inst.edges[0].transported, 0);
  EXPECT_EQ(inst.edges[1].transported, 1);
  EXPECT_EQ(inst.edges[2].transported, 1);
  validate_supply_satisfied(inst.nodes, inst.edges);
  validate_summary(s, inst.nodes, inst.edges, inst.opts);
}

//=============================================================================
// SECTION 3: UNBALANCED AND DEGENERATE INSTANCES
//=============================================================================

TEST(SolveTransport, SurplusSupplyIsPartial) {
  Instance inst;
  inst.nodes = make_nodes({8, -5});
  add_edge(inst, 0, 1, 2, 100);
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.total_supply, 8);
  EXPECT_EQ(s.total_demand, 5);
  EXPECT_EQ(s.flow, 5);
  EXPECT_EQ(s.cost, 10);
}

TEST(SolveTransport, SurplusDemandRoutesAllSupply) {
  Instance inst;
  inst.nodes = make_nodes({4, -5, -3});
  add_edge(inst, 0, 1, 3, 100);
  add_edge(inst, 0, 2, 1, 100);
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_TRUE(is_complete(s));
  EXPECT_EQ(s.flow, 4);
  EXPECT_EQ(inst.edges[1].transported, 3);
  EXPECT_EQ(inst.edges[0].transported, 1);
  EXPECT_EQ(s.cost, 3 * 1 + 1 * 3);
}

TEST(SolveTransport, NoSupplyNoFlowButEdgesAssigned) {
  std::vector<Node> nodes = {{0, 0}, {1, 0}};
  std::vector<Edge> edges = {{0, 1}, {1, 0}};
  auto s = solve_transport(nodes, edges);
  EXPECT_EQ(s.flow, 0);
  EXPECT_EQ(s.cost, 0);
  EXPECT_EQ(s.iterations, 0);
  validate_all_assigned(edges);
}

TEST(SolveTransport, SingleNodeNoEdges) {
  std::vector<Node> nodes = {{0, 3}};
  std::vector<Edge> edges;
  auto s = solve_transport(nodes, edges);
  EXPECT_EQ(s.flow, 0);
  EXPECT_EQ(s.total_supply, 3);
}

TEST(SolveTransport, PreexistingAssignmentIsIgnored) {
  Instance inst;
  inst.nodes = make_nodes({5, -5});
  add_edge(inst, 0, 1, 1, 100);
  inst.edges[0].transported = 999;
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, 5);
  EXPECT_EQ(inst.edges[0].transported, 5);
}

//=============================================================================
// SECTION 4: VALIDATION
//=============================================================================

TEST(SolveTransport, InvalidInputLeavesEdgesUntouched) {
  Instance inst;
  inst.nodes = make_nodes({5, 0, -5});
  add_edge(inst, 0, 1, 1, 100);
  add_edge(inst, 1, 2, 1, -3);
  EXPECT_THROW((void)solve_transport(inst.nodes, inst.edges, inst.opts), InvalidInput);
  for (auto const& e : inst.edges) EXPECT_EQ(e.transported, kUnassigned);
}

TEST(SolveTransport, EmptyNodeListIsInvalid) {
  std::vector<Node> nodes;
  std::vector<Edge> edges;
  EXPECT_THROW((void)solve_transport(nodes, edges), InvalidInput);
}

TEST(SolveTransport, TooManyEdgesIsInvalid) {
  std::vector<Node> nodes = {{0, 1}, {1, -1}};
  std::vector<Edge> edges = {{0, 1}, {1, 0}, {0, 1}};
  EXPECT_THROW((void)solve_transport(nodes, edges), InvalidInput);
  for (auto const& e : edges) EXPECT_FALSE(e.is_assigned());
}

TEST(SolveTransport, CostAboveMillionIsAccepted) {
  Instance inst;
  inst.nodes = make_nodes({5, -5});
  inst.edges.push_back(Edge{0, 1});
  inst.opts.costs[EdgeKey{0, 1}] = 2'000'000;
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, 5);
  EXPECT_EQ(s.cost, 10'000'000);
  EXPECT_EQ(inst.edges[0].transported, 5);
}

TEST(SolveTransport, TotalSupplyAboveUnlimitedCapIsInvalid) {
  std::vector<Node> nodes = {{0, kUnlimitedCap}, {1, 1}, {2, -kUnlimitedCap - 1}};
  std::vector<Edge> edges = {{0, 2}, {1, 2}};
  EXPECT_THROW((void)solve_transport(nodes, edges), InvalidInput);
  for (auto const& e : edges) EXPECT_FALSE(e.is_assigned());
}

TEST(SolveTransport, CostOverflowThrowsBeforeMapping) {
  // 11 hops at 10^6 each carry 10^12 units: the total needs more than int64.
  auto inst = make_line_instance(12, kUnlimitedCap, kUnlimitedCap);
  for (auto& [key, cost] : inst.opts.costs) cost = 1'000'000;
  EXPECT_THROW((void)solve_transport(inst.nodes, inst.edges, inst.opts), RuntimeError);
  for (auto const& e : inst.edges) EXPECT_EQ(e.transported, kUnassigned);
}

TEST(SolveTransport, LargeCostJustBelowOverflowIsExact) {
  auto inst = make_line_instance(2, kUnlimitedCap, kUnlimitedCap);
  inst.opts.costs[EdgeKey{0, 1}] = 9'000'000;
  auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
  EXPECT_EQ(s.flow, kUnlimitedCap);
  EXPECT_EQ(s.cost, 9'000'000'000'000'000'000LL);
}

//=============================================================================
// SECTION 5: RANDOMIZED PROPERTIES
//=============================================================================

TEST(SolveTransport, RandomBalancedInstancesMatchReference) {
  for (std::uint64_t seed = 1; seed <= 40; ++seed) {
    auto g = generate_random_directed_graph(7, 18, seed, 6, true);
    Instance inst;
    inst.nodes = g.nodes;
    inst.edges = g.edges;
    for (std::size_t i = 0; i < inst.edges.size(); ++i) {
      auto const& e = inst.edges[i];
      inst.opts.costs[e.key()] = static_cast<Cost>(1 + (seed * 7 + i * 13) % 9);
      if (i % 3 == 0) inst.opts.capacities[e.key()] = static_cast<Cap>(1 + (seed + i) % 5);
    }
    auto ref = reference_min_cost_flow(inst);
    auto s = solve_transport(inst.nodes, inst.edges, inst.opts);
    EXPECT_EQ(s.flow, ref.first) << "seed " << seed;
    EXPECT_EQ(s.cost, ref.second) << "seed " << seed;
    validate_summary(s, inst.nodes, inst.edges, inst.opts);
    if (is_complete(s) && s.total_supply == s.total_demand) {
      validate_supply_satisfied(inst.nodes, inst.edges);
    }
  }
}

TEST(SolveTransport, RandomUnbalancedInstancesStayConsistent) {
  for (std::uint64_t seed = 100; seed < 120; ++seed) {
    auto g = generate_random_directed_graph(9, 25, seed, 8, false);
    SolveOptions opts;
    auto s = solve_transport(g.nodes, g.edges, opts);
    EXPECT_LE(s.flow, std::min(s.total_supply, s.total_demand));
    validate_summary(s, g.nodes, g.edges, opts);
  }
}

TEST(SolveTransport, DeterministicSummary) {
  auto g = generate_random_directed_graph(12, 60, 2024, 10, true);
  SolveOptions opts;
  for (std::size_t i = 0; i < g.edges.size(); ++i) {
    opts.costs[g.edges[i].key()] = static_cast<Cost>(i % 4);
  }
  auto first_edges = g.edges;
  auto second_edges = g.edges;
  auto a = solve_transport(g.nodes, first_edges, opts);
  auto b = solve_transport(g.nodes, second_edges, opts);
  EXPECT_EQ(a.flow, b.flow);
  EXPECT_EQ(a.cost, b.cost);
  EXPECT_EQ(a.costs, b.costs);
  EXPECT_EQ(a.flows, b.flows);
}
