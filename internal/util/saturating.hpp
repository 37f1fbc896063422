#pragma once

#include <cstdint>
#include <limits>
#include <optional>

namespace capacity::util {

/*
  Overflow-aware integer helpers.

  Checked* return nullopt instead of wrapping. Saturating* clamp to the type
  bounds. Nothing in the accounting path uses plain +, - or * on balances.
*/

using uint128 = unsigned __int128;

constexpr std::optional<uint64_t> CheckedAdd(uint64_t a, uint64_t b) {
  uint64_t out = 0;
  if (__builtin_add_overflow(a, b, &out)) return std::nullopt;
  return out;
}

constexpr std::optional<uint64_t> CheckedSub(uint64_t a, uint64_t b) {
  if (b > a) return std::nullopt;
  return a - b;
}

constexpr std::optional<uint64_t> CheckedMul(uint64_t a, uint64_t b) {
  uint64_t out = 0;
  if (__builtin_mul_overflow(a, b, &out)) return std::nullopt;
  return out;
}

constexpr uint64_t SaturatingAdd(uint64_t a, uint64_t b) {
  return CheckedAdd(a, b).value_or(std::numeric_limits<uint64_t>::max());
}

constexpr uint64_t SaturatingMul(uint64_t a, uint64_t b) {
  return CheckedMul(a, b).value_or(std::numeric_limits<uint64_t>::max());
}

constexpr uint64_t SaturatingSub(uint64_t a, uint64_t b) {
  return b > a ? 0 : a - b;
}

// floor(a * b * c / divisor) through a 128-bit intermediate.
// nullopt when the product does not fit 128 bits or the quotient does not fit 64 bits.
constexpr std::optional<uint64_t> MulMulDiv(uint64_t a, uint64_t b, uint64_t c, uint64_t divisor) {
  if (divisor == 0) return std::nullopt;

  uint128 ab = static_cast<uint128>(a) * b;
  uint128 abc = 0;
  if (__builtin_mul_overflow(ab, static_cast<uint128>(c), &abc)) return std::nullopt;

  const uint128 quotient = abc / divisor;
  if (quotient > std::numeric_limits<uint64_t>::max()) return std::nullopt;
  return static_cast<uint64_t>(quotient);
}

} // namespace capacity::util
