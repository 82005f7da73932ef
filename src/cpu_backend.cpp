/*
  CPU Backend — thin adapter that delegates to in-process algorithms.
*/
#include "transflow/core/backend.hpp"
#include "transflow/core/generator.hpp"
#include "transflow/core/min_cost_flow.hpp"

namespace transflow::core {

namespace {
class CpuBackend final : public Backend {
public:
  TransportSummary solve(std::span<const Node> nodes, std::span<Edge> edges,
                         const SolveOptions& opts) override {
    return transflow::core::solve_transport(nodes, edges, opts);
  }

  GeneratedGraph generate(const GeneratorOptions& opts) override {
    return transflow::core::generate_random_directed_graph(opts);
  }
};
} // namespace

BackendPtr make_cpu_backend() {
  return std::make_shared<CpuBackend>();
}

} // namespace transflow::core
