#pragma once

#include <stdexcept>
#include <string>

namespace transflow::core {

// Malformed instance or overrides. Raised before any Edge is mutated.
struct InvalidInput : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace transflow::core
