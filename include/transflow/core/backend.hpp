/*
  Backend interface — abstracts instance generation and transport solving.

  The default CPU backend delegates to in-process algorithm implementations.
  All execution flows through this interface via an Algorithms façade.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual: method can be overridden in subclasses (like Python's inheritance)
  - = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <memory>
#include <span>

#include "transflow/core/generator.hpp"
#include "transflow/core/instance.hpp"
#include "transflow/core/min_cost_flow.hpp"
#include "transflow/core/types.hpp"

namespace transflow::core {

class Backend {
public:
  virtual ~Backend() noexcept = default;

  // Solve one instance in place; see solve_transport for the contract.
  [[nodiscard]] virtual TransportSummary solve(
      std::span<const Node> nodes, std::span<Edge> edges, const SolveOptions& opts) = 0;

  [[nodiscard]] virtual GeneratedGraph generate(const GeneratorOptions& opts) = 0;
};

using BackendPtr = std::shared_ptr<Backend>;

[[nodiscard]] BackendPtr make_cpu_backend();

} // namespace transflow::core
