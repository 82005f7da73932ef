/* Algorithms façade: forwards calls to a Backend. */
#pragma once

#include <span>
#include <utility>

#include "transflow/core/backend.hpp"
#include "transflow/core/error.hpp"

namespace transflow::core {

class Algorithms {
public:
  explicit Algorithms(BackendPtr backend) : backend_(std::move(backend)) {
    if (!backend_) throw InvalidInput("Algorithms: backend must not be null");
  }

  [[nodiscard]] TransportSummary solve(std::span<const Node> nodes, std::span<Edge> edges,
                                       const SolveOptions& opts = {}) const {
    return backend_->solve(nodes, edges, opts);
  }

  [[nodiscard]] GeneratedGraph generate(const GeneratorOptions& opts) const {
    return backend_->generate(opts);
  }

  [[nodiscard]] const BackendPtr& backend() const noexcept { return backend_; }

private:
  BackendPtr backend_;
};

} // namespace transflow::core
