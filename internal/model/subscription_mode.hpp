#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace capacity::model {

enum class SubscriptionKind : std::uint8_t {
  kLifetime = 0,
  kDaily    = 1,
};

constexpr std::string_view ToString(SubscriptionKind kind) {
  switch (kind) {
    case SubscriptionKind::kLifetime:
      return "lifetime";
    case SubscriptionKind::kDaily:
    default:
      return "daily";
  }
}

/*
  Lifetime { tps }  accrues `tps` uTPS forever.
  Daily { days }    accrues the fixed daily rate until issue_time + days.

  `value` carries tps for Lifetime and days for Daily.
*/
struct SubscriptionMode {
  SubscriptionKind kind  = SubscriptionKind::kDaily;
  std::uint32_t    value = 0;

  static constexpr SubscriptionMode Lifetime(std::uint32_t tps) {
    return {SubscriptionKind::kLifetime, tps};
  }

  static constexpr SubscriptionMode Daily(std::uint32_t days) {
    return {SubscriptionKind::kDaily, days};
  }

  constexpr bool IsLifetime() const {
    return kind == SubscriptionKind::kLifetime;
  }

  constexpr bool IsDaily() const {
    return kind == SubscriptionKind::kDaily;
  }

  // Accrual rate in uTPS; daily subscriptions use the configured constant.
  constexpr std::uint32_t Tps(std::uint32_t daily_utps) const {
    return IsLifetime() ? value : daily_utps;
  }

  std::string Describe() const {
    return std::string(ToString(kind)) + (IsLifetime() ? "(tps=" : "(days=") + std::to_string(value) + ")";
  }
};

constexpr bool operator==(const SubscriptionMode& a, const SubscriptionMode& b) {
  return a.kind == b.kind && a.value == b.value;
}

} // namespace capacity::model
