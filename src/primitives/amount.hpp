#pragma once

#include <cstdint>
#include <string>

namespace kasstamp::primitives {

using Amount = std::uint64_t;  // Amounts denominated in sompi (1e-8 KAS).

inline constexpr Amount kSompiPerKas = 100'000'000ULL;
inline constexpr Amount kMaxSompi = 29'000'000'000ULL * kSompiPerKas;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxSompi; }

inline bool CheckedAdd(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (a > kMaxSompi - b) {
    return false;
  }
  if (out) {
    *out = a + b;
  }
  return true;
}

inline bool CheckedSub(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b) || b > a) {
    return false;
  }
  if (out) {
    *out = a - b;
  }
  return true;
}

// "1.23456789" style rendering for logs and CLI output.
std::string FormatKas(Amount sompi);

}  // namespace kasstamp::primitives
