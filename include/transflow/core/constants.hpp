/* Numeric constants shared by the builder, augmentor and generator. */
#pragma once

#include <limits>

#include "transflow/core/types.hpp"

namespace transflow::core {

// Capacity used for edges without an explicit override. Must exceed any
// achievable flow; caller-supplied capacities, total supply and total demand
// may not go above it.
inline constexpr Cap kUnlimitedCap = 1'000'000'000'000LL;

// Cost used for edges without an explicit override.
inline constexpr Cost kDefaultCost = 1;

// Largest accepted node id. The residual network adds two synthetic nodes
// after max id, all indexed by NodeId.
inline constexpr NodeId kMaxNodeId = std::numeric_limits<NodeId>::max() - 3;

// Sentinel for Edge::transported before a solve assigns it.
inline constexpr Flow kUnassigned = -1;

// Distance of nodes not reached by the shortest-path search.
inline constexpr Cost kUnreachable = std::numeric_limits<Cost>::max();

} // namespace transflow::core
