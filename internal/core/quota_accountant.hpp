#pragma once

#include <cstdint>
#include <optional>

#include "internal/db/model/subscription_record.hpp"
#include "internal/util/time.hpp"

namespace capacity::core {

/*
  QuotaAccountant

  Lazy accrual-then-debit arithmetic over a single subscription ledger.
  Operates on records only; lookups and persistence belong to the caller.

    accrued = reference_call_cost * rate_utps * elapsed_ms / 10^12

  All steps are overflow-checked. An accrual that does not fit fails closed
  with QuotaExhausted rather than granting a clamped amount.
*/
class QuotaAccountant {
 public:
  struct Options {
    uint64_t reference_call_cost = 35'476'000;
    uint32_t daily_utps          = 10'000;
    // 0 = unlimited
    uint64_t max_free_weight = 0;
  };

  explicit QuotaAccountant(Options options);

  // Returns `sub` accrued up to `now`.
  // Throws SubscriptionExpired, ClockRegression or QuotaExhausted.
  db::model::SubscriptionRecord Accrue(db::model::SubscriptionRecord sub, util::Timestamp now) const;

  // Throws QuotaExhausted when cost > free_weight; `sub` is untouched then.
  void Debit(db::model::SubscriptionRecord& sub, uint64_t cost) const;

  // Debits as much of `cost` as the ledger holds and returns the remainder.
  uint64_t DebitUpTo(db::model::SubscriptionRecord& sub, uint64_t cost) const;

  bool IsExpired(const db::model::SubscriptionRecord& sub, util::Timestamp now) const;

  // Weight accrued by `mode` over `elapsed_ms`; nullopt on overflow.
  std::optional<uint64_t> AccruedWeight(const model::SubscriptionMode& mode, uint64_t elapsed_ms) const;

  // Expiration for a subscription of `mode` issued at `issue_time_ms`.
  static std::optional<uint64_t> ExpirationFor(const model::SubscriptionMode& mode, util::Timestamp issue_time_ms);

  const Options& options() const {
    return options_;
  }

 private:
  Options options_;
};

} // namespace capacity::core
