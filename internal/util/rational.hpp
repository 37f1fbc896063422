#pragma once

#include <cstdint>
#include <optional>

#include "saturating.hpp"

namespace capacity::util {

/*
  Exact non-negative fraction used for unit conversions (asset -> uTPS).

  Multiplication always floors. The floor is what makes a lock/unlock cycle
  reproduce the same throughput for the same amount.
*/
struct Rational {
  uint64_t numerator   = 0;
  uint64_t denominator = 1;

  constexpr bool IsValid() const {
    return denominator != 0;
  }

  constexpr bool IsZero() const {
    return numerator == 0;
  }

  // floor(value * numerator / denominator); nullopt on overflow of uint64.
  constexpr std::optional<uint64_t> MulFloor(uint64_t value) const {
    return MulMulDiv(value, numerator, 1, denominator);
  }

  // Same as MulFloor, clamped to the uint64 range.
  constexpr uint64_t SaturatingMulFloor(uint64_t value) const {
    if (!IsValid()) return 0;
    return MulFloor(value).value_or(std::numeric_limits<uint64_t>::max());
  }
};

constexpr bool operator==(const Rational& a, const Rational& b) {
  return static_cast<uint128>(a.numerator) * b.denominator == static_cast<uint128>(b.numerator) * a.denominator;
}

} // namespace capacity::util
