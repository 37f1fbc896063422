#include "internal/core/quota_accountant.hpp"

#include <cassert>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"

namespace {

using capacity::core::QuotaAccountant;
using capacity::db::model::SubscriptionRecord;
using capacity::model::SubscriptionMode;

constexpr uint64_t kStart = 1'700'000'000'000ULL;

SubscriptionRecord MakeSubscription(SubscriptionMode mode, uint64_t issued_at = kStart) {
  SubscriptionRecord sub;
  sub.owner              = "alice";
  sub.local_id           = 0;
  sub.mode               = mode;
  sub.issue_time_ms      = issued_at;
  sub.last_update_ms     = issued_at;
  sub.expiration_time_ms = QuotaAccountant::ExpirationFor(mode, issued_at);
  return sub;
}

void TestLifetimeAccrualFloorsFractionalWeight() {
  QuotaAccountant quota({});

  auto sub = quota.Accrue(MakeSubscription(SubscriptionMode::Lifetime(50'000)), kStart + 2'000);
  assert(sub.free_weight == 3'547);
  assert(sub.last_update_ms == kStart + 2'000);
}

void TestDailyAccruesAtConfiguredRate() {
  QuotaAccountant::Options options;
  options.daily_utps = 20'000;
  QuotaAccountant quota(options);

  // 35_476_000 * 20_000 * 1_000 / 10^12 = 709.52
  auto sub = quota.Accrue(MakeSubscription(SubscriptionMode::Daily(3)), kStart + 1'000);
  assert(sub.free_weight == 709);
}

void TestDailyExpiresAndNeverGrowsAgain() {
  QuotaAccountant quota({});
  auto            sub = MakeSubscription(SubscriptionMode::Daily(1));
  assert(sub.expiration_time_ms == kStart + 86'400'000);

  sub                 = quota.Accrue(sub, kStart + 86'399'999);
  const auto held     = sub.free_weight;
  bool       rejected = false;
  try {
    sub = quota.Accrue(sub, kStart + 86'400'000);
  } catch (const capacity::util::SubscriptionExpired&) {
    rejected = true;
  }
  assert(rejected);
  assert(sub.free_weight == held);

  rejected = false;
  try {
    quota.Accrue(sub, kStart + 10 * 86'400'000ULL);
  } catch (const capacity::util::SubscriptionExpired&) {
    rejected = true;
  }
  assert(rejected);
  assert(quota.IsExpired(sub, kStart + 86'400'000));
  assert(!quota.IsExpired(sub, kStart + 86'399'999));
}

void TestClockRegressionIsRejected() {
  QuotaAccountant quota({});
  auto            sub = MakeSubscription(SubscriptionMode::Lifetime(1'000));

  bool rejected = false;
  try {
    quota.Accrue(sub, kStart - 1);
  } catch (const capacity::util::ClockRegression&) {
    rejected = true;
  }
  assert(rejected);

  // zero elapsed is fine and accrues nothing
  sub = quota.Accrue(sub, kStart);
  assert(sub.free_weight == 0);
}

void TestAccrualOverflowFailsClosed() {
  QuotaAccountant::Options options;
  options.reference_call_cost = std::numeric_limits<uint64_t>::max();
  QuotaAccountant quota(options);

  auto sub        = MakeSubscription(SubscriptionMode::Lifetime(std::numeric_limits<uint32_t>::max()), 0);
  sub.free_weight = 7;

  bool rejected = false;
  try {
    quota.Accrue(sub, std::numeric_limits<uint64_t>::max());
  } catch (const capacity::util::QuotaExhausted&) {
    rejected = true;
  }
  assert(rejected);
  assert(sub.free_weight == 7);
}

void TestFreeWeightSaturatesInsteadOfWrapping() {
  QuotaAccountant quota({});
  auto            sub = MakeSubscription(SubscriptionMode::Lifetime(1'000'000));
  sub.free_weight     = std::numeric_limits<uint64_t>::max() - 1;

  sub = quota.Accrue(sub, kStart + 60'000);
  assert(sub.free_weight == std::numeric_limits<uint64_t>::max());
}

void TestAccumulationCeiling() {
  QuotaAccountant::Options options;
  options.max_free_weight = 1'000;
  QuotaAccountant quota(options);

  auto sub = quota.Accrue(MakeSubscription(SubscriptionMode::Lifetime(1'000'000)), kStart + 60'000);
  assert(sub.free_weight == 1'000);

  // weight above the ceiling (e.g. after a config change) is kept
  sub.free_weight = 5'000;
  sub             = quota.Accrue(sub, kStart + 120'000);
  assert(sub.free_weight == 5'000);
}

void TestDebit() {
  QuotaAccountant quota({});
  auto            sub = MakeSubscription(SubscriptionMode::Lifetime(50'000));
  sub.free_weight     = 100;

  quota.Debit(sub, 40);
  assert(sub.free_weight == 60);

  bool rejected = false;
  try {
    quota.Debit(sub, 61);
  } catch (const capacity::util::QuotaExhausted&) {
    rejected = true;
  }
  assert(rejected);
  assert(sub.free_weight == 60);

  quota.Debit(sub, 60);
  assert(sub.free_weight == 0);
}

void TestDebitUpToDrainsAndReportsShortfall() {
  QuotaAccountant quota({});
  auto            sub = MakeSubscription(SubscriptionMode::Lifetime(50'000));
  sub.free_weight     = 25;

  assert(quota.DebitUpTo(sub, 10) == 0);
  assert(sub.free_weight == 15);
  assert(quota.DebitUpTo(sub, 40) == 25);
  assert(sub.free_weight == 0);
}

void TestFreeWeightNonDecreasingBetweenDebits() {
  QuotaAccountant quota({});
  auto            sub  = MakeSubscription(SubscriptionMode::Lifetime(7'777));
  uint64_t        last = 0;
  for (uint64_t step = 1; step <= 50; ++step) {
    sub = quota.Accrue(sub, kStart + step * 137);
    assert(sub.free_weight >= last);
    last = sub.free_weight;
  }
}

} // namespace

int main() {
  TestLifetimeAccrualFloorsFractionalWeight();
  TestDailyAccruesAtConfiguredRate();
  TestDailyExpiresAndNeverGrowsAgain();
  TestClockRegressionIsRejected();
  TestAccrualOverflowFailsClosed();
  TestFreeWeightSaturatesInsteadOfWrapping();
  TestAccumulationCeiling();
  TestDebit();
  TestDebitUpToDrainsAndReportsShortfall();
  TestFreeWeightNonDecreasingBetweenDebits();

  std::cout << "capacity_manager_unit_quota_accountant: pass\n";
  return 0;
}
