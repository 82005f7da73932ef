/* Overflow-checked int64 arithmetic for cost accumulation. */
#pragma once

#include <cstdint>
#include <string>

#include "transflow/core/error.hpp"

namespace transflow::core {

// Each helper throws RuntimeError naming `what` when the exact result does
// not fit in int64.
[[nodiscard]] inline std::int64_t checked_add(std::int64_t a, std::int64_t b, const char* what) {
  std::int64_t out = 0;
  if (__builtin_add_overflow(a, b, &out)) {
    throw RuntimeError(std::string("int64 overflow in ") + what + ": " +
                       std::to_string(a) + " + " + std::to_string(b));
  }
  return out;
}

[[nodiscard]] inline std::int64_t checked_sub(std::int64_t a, std::int64_t b, const char* what) {
  std::int64_t out = 0;
  if (__builtin_sub_overflow(a, b, &out)) {
    throw RuntimeError(std::string("int64 overflow in ") + what + ": " +
                       std::to_string(a) + " - " + std::to_string(b));
  }
  return out;
}

[[nodiscard]] inline std::int64_t checked_mul(std::int64_t a, std::int64_t b, const char* what) {
  std::int64_t out = 0;
  if (__builtin_mul_overflow(a, b, &out)) {
    throw RuntimeError(std::string("int64 overflow in ") + what + ": " +
                       std::to_string(a) + " * " + std::to_string(b));
  }
  return out;
}

} // namespace transflow::core
