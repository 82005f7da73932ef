/* Residual flow network with paired forward/reverse arcs per adjacency slot. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "transflow/core/instance.hpp"
#include "transflow/core/types.hpp"

namespace transflow::core {

// Arc of the residual network. `rev` is the slot of the paired arc in
// arcs(to). Reverse arcs carry the negated cost and start at zero capacity.
struct ResidualEdge {
  NodeId to { -1 };
  std::int32_t rev { -1 };
  Cap cap { 0 };
  Cost cost { 0 };
};

// Adjacency-list residual network over n original nodes plus two synthetic
// nodes: super_source() == n and super_sink() == n + 1. Slots are append-only,
// so a slot index handed out by add_arc stays valid for the graph lifetime.
class ResidualGraph {
public:
  explicit ResidualGraph(std::int32_t num_original_nodes);

  // Append the forward arc u->v and its reverse v->u. Returns the slot of the
  // forward arc in arcs(u).
  std::int32_t add_arc(NodeId u, NodeId v, Cap cap, Cost cost);

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(adj_.size()); }
  [[nodiscard]] std::int32_t num_original_nodes() const noexcept { return num_nodes() - 2; }
  [[nodiscard]] std::int64_t num_arcs() const noexcept { return num_arcs_; }
  [[nodiscard]] NodeId super_source() const noexcept { return num_original_nodes(); }
  [[nodiscard]] NodeId super_sink() const noexcept { return num_original_nodes() + 1; }

  [[nodiscard]] std::span<const ResidualEdge> arcs(NodeId u) const noexcept {
    return adj_[static_cast<std::size_t>(u)];
  }
  [[nodiscard]] const ResidualEdge& arc(NodeId u, std::int32_t slot) const noexcept {
    return adj_[static_cast<std::size_t>(u)][static_cast<std::size_t>(slot)];
  }
  [[nodiscard]] const ResidualEdge& reverse_of(const ResidualEdge& e) const noexcept {
    return arc(e.to, e.rev);
  }

  // Move `amount` units across arc (u, slot): the forward arc loses capacity,
  // its paired reverse arc gains the same amount.
  void push(NodeId u, std::int32_t slot, Flow amount) noexcept;

private:
  std::vector<std::vector<ResidualEdge>> adj_;
  std::int64_t num_arcs_ {0};
};

// Back-reference from an original edge to its forward arc.
struct EdgeRef {
  NodeId owner { -1 };
  std::int32_t slot { -1 };
  Cap initial_cap { 0 };
};

// Residual network built for one solve call. refs[i] belongs to edges[i].
struct ResidualNetwork {
  ResidualGraph graph;
  std::vector<EdgeRef> refs;
  // Sum of positive supplies; the augmentor never pushes more than this.
  Flow target_flow { 0 };
  // Sum of absolute negative supplies.
  Flow total_demand { 0 };
};

// Throws InvalidInput when the instance or its overrides are malformed.
// Performs no mutation; safe to call before touching any Edge.
void validate_instance(std::span<const Node> nodes,
                       std::span<const Edge> edges,
                       const SolveOptions& opts);

// Validate, then build one forward/reverse pair per edge (cost override or
// kDefaultCost, capacity override or kUnlimitedCap), a super-source arc per
// producer (capacity = supply) and a super-sink arc per consumer
// (capacity = -supply). Node ids size the graph as max id + 1.
[[nodiscard]] ResidualNetwork build_residual_network(std::span<const Node> nodes,
                                                     std::span<const Edge> edges,
                                                     const SolveOptions& opts);

} // namespace transflow::core
