/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId: int32 (matches np.int32)
 * - Cost/Cap/Flow/Supply: int64 (matches np.int64)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::unordered_map<EdgeKey, T>: dict keyed by (source, target) tuples
 */
#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>

namespace transflow::core {

// Node identifiers are signed 32-bit integers.
using NodeId = std::int32_t;
using Cost   = std::int64_t;  // Arc cost and accumulated path cost
using Cap    = std::int64_t;  // Arc capacity (integral units)
using Flow   = std::int64_t;  // Flow amount (same unit as capacity)
using Supply = std::int64_t;  // Signed node supply: >0 emits, <0 absorbs

// EdgeKey identifies an original edge by its endpoints (source, target).
// Used as a key in cost/capacity overrides (like Python dict keyed by tuples).
struct EdgeKey {
  NodeId source;
  NodeId target;
  friend bool operator==(const EdgeKey& a, const EdgeKey& b) noexcept {
    return a.source == b.source && a.target == b.target;
  }
};

// Hash function for EdgeKey (enables use in std::unordered_map).
struct EdgeKeyHash {
  std::size_t operator()(const EdgeKey& k) const noexcept {
    std::size_t h = 0;
    auto combine = [&h](std::size_t v) {
      // Hash combine formula (similar to Python's hash tuple)
      h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    combine(std::hash<NodeId>{}(k.source));
    combine(std::hash<NodeId>{}(k.target));
    return h;
  }
};

using CostMap = std::unordered_map<EdgeKey, Cost, EdgeKeyHash>;
using CapacityMap = std::unordered_map<EdgeKey, Cap, EdgeKeyHash>;

// Per-call overrides. Edges without an entry get kDefaultCost / kUnlimitedCap.
struct SolveOptions {
  CostMap costs {};
  CapacityMap capacities {};
};

} // namespace transflow::core
