#include "internal/core/quota_accountant.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/saturating.hpp"

namespace capacity::core {

namespace {

// ms * uTPS -> operations
constexpr uint64_t kAccrualDivisor = 1'000'000'000'000ULL;

std::string Describe(const db::model::SubscriptionRecord& sub) {
  return sub.owner + "/" + std::to_string(sub.local_id);
}

} // namespace

QuotaAccountant::QuotaAccountant(Options options) : options_(options) {
}

bool QuotaAccountant::IsExpired(const db::model::SubscriptionRecord& sub, util::Timestamp now) const {
  return sub.mode.IsDaily() && sub.expiration_time_ms.has_value() && now >= *sub.expiration_time_ms;
}

std::optional<uint64_t> QuotaAccountant::AccruedWeight(const model::SubscriptionMode& mode, uint64_t elapsed_ms) const {
  return util::MulMulDiv(options_.reference_call_cost, mode.Tps(options_.daily_utps), elapsed_ms, kAccrualDivisor);
}

std::optional<uint64_t> QuotaAccountant::ExpirationFor(const model::SubscriptionMode& mode, util::Timestamp issue_time_ms) {
  if (!mode.IsDaily()) return std::nullopt;
  return util::SaturatingAdd(issue_time_ms, util::SaturatingMul(mode.value, util::kMillisPerDay));
}

db::model::SubscriptionRecord QuotaAccountant::Accrue(db::model::SubscriptionRecord sub, util::Timestamp now) const {
  if (IsExpired(sub, now)) {
    throw util::SubscriptionExpired("subscription " + Describe(sub) + " expired at " + std::to_string(*sub.expiration_time_ms));
  }
  if (now < sub.last_update_ms) {
    throw util::ClockRegression("time source went backwards: now " + std::to_string(now) + " < last update " + std::to_string(sub.last_update_ms));
  }

  const auto accrued = AccruedWeight(sub.mode, now - sub.last_update_ms);
  if (!accrued) {
    throw util::QuotaExhausted("subscription " + Describe(sub) + ": accrual overflow");
  }

  uint64_t free_weight = util::SaturatingAdd(sub.free_weight, *accrued);
  if (options_.max_free_weight != 0 && free_weight > options_.max_free_weight) {
    // the ceiling stops growth; it never takes away weight already held
    free_weight = std::max(sub.free_weight, options_.max_free_weight);
  }
  sub.free_weight = free_weight;
  sub.last_update_ms = now;
  return sub;
}

void QuotaAccountant::Debit(db::model::SubscriptionRecord& sub, uint64_t cost) const {
  const auto remaining = util::CheckedSub(sub.free_weight, cost);
  if (!remaining) {
    throw util::QuotaExhausted("subscription " + Describe(sub) + ": cost " + std::to_string(cost) + " exceeds free weight " +
                               std::to_string(sub.free_weight));
  }
  sub.free_weight = *remaining;
}

uint64_t QuotaAccountant::DebitUpTo(db::model::SubscriptionRecord& sub, uint64_t cost) const {
  const uint64_t debited = std::min(cost, sub.free_weight);
  sub.free_weight -= debited;
  return cost - debited;
}

} // namespace capacity::core
