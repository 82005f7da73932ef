/*
  Instance helpers — supply classification, totals and a text listing of an
  instance for the demo tool and debugging.
*/
#include "transflow/core/instance.hpp"

#include <sstream>

namespace transflow::core {

NodeKind node_kind(const Node& n) noexcept {
  if (n.is_producer()) return NodeKind::Producer;
  if (n.is_consumer()) return NodeKind::Consumer;
  return NodeKind::Intermediate;
}

std::string_view to_string(NodeKind kind) noexcept {
  switch (kind) {
    case NodeKind::Producer: return "Producer";
    case NodeKind::Consumer: return "Consumer";
    case NodeKind::Intermediate: return "Neutral";
  }
  return "Neutral";
}

Supply total_supply(std::span<const Node> nodes) noexcept {
  Supply total = 0;
  for (auto const& n : nodes) {
    if (n.supply > 0) total += n.supply;
  }
  return total;
}

Supply total_demand(std::span<const Node> nodes) noexcept {
  Supply total = 0;
  for (auto const& n : nodes) {
    if (n.supply < 0) total -= n.supply;
  }
  return total;
}

Supply supply_imbalance(std::span<const Node> nodes) noexcept {
  Supply sum = 0;
  for (auto const& n : nodes) sum += n.supply;
  return sum;
}

std::string format_graph(std::span<const Node> nodes, std::span<const Edge> edges) {
  std::ostringstream os;
  os << "Nodes:\n";
  for (auto const& n : nodes) {
    os << "  id=" << n.id << " supply=" << n.supply
       << " (" << to_string(node_kind(n)) << ")\n";
  }
  os << "\nEdges:\n";
  for (auto const& e : edges) {
    os << "  " << e.source << " -> " << e.target << " transported=";
    if (e.is_assigned()) {
      os << e.transported;
    } else {
      os << "unassigned";
    }
    os << '\n';
  }
  return os.str();
}

} // namespace transflow::core
