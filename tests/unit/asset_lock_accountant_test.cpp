#include "internal/core/asset_lock_accountant.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/auction_manager.hpp"
#include "internal/core/quota_accountant.hpp"
#include "internal/currency/memory_currency.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/util/errors.hpp"

namespace {

using capacity::core::AssetLockAccountant;
using capacity::model::Origin;
using capacity::model::SubscriptionMode;
namespace v1 = capacity::manager::v1;

constexpr uint64_t kStart = 1'700'000'000'000ULL;

struct Fixture {
  std::shared_ptr<capacity::db::memory::MemoryRepository> repository = std::make_shared<capacity::db::memory::MemoryRepository>();
  std::shared_ptr<capacity::currency::MemoryCurrency>     currency   = std::make_shared<capacity::currency::MemoryCurrency>();
  std::shared_ptr<capacity::events::EventLog>             events     = std::make_shared<capacity::events::EventLog>();
  std::shared_ptr<capacity::util::ManualTimeSource>       clock      = std::make_shared<capacity::util::ManualTimeSource>(kStart);
  AssetLockAccountant                                     locks;

  explicit Fixture(AssetLockAccountant::Options options = {}) : locks(repository, currency, events, clock, options) {
    currency->Deposit("alice", 10'000);
  }
};

// Forwards to the memory backend and counts full scans of the lock table.
class ScanCountingRepository final : public capacity::db::Repository {
 public:
  std::unique_ptr<capacity::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  uint32_t NextAuctionId(capacity::db::Transaction& tx) override {
    return inner_.NextAuctionId(tx);
  }
  capacity::db::Result InsertAuction(capacity::db::Transaction& tx, const capacity::db::model::AuctionRecord& r) override {
    return inner_.InsertAuction(tx, r);
  }
  std::optional<capacity::db::model::AuctionRecord> GetAuction(capacity::db::Transaction& tx, uint32_t id) override {
    return inner_.GetAuction(tx, id);
  }
  std::vector<capacity::db::model::AuctionRecord> ListAuctions(capacity::db::Transaction& tx) override {
    return inner_.ListAuctions(tx);
  }
  capacity::db::Result UpdateAuction(capacity::db::Transaction& tx, const capacity::db::model::AuctionRecord& r) override {
    return inner_.UpdateAuction(tx, r);
  }
  uint32_t NextSubscriptionId(capacity::db::Transaction& tx, const std::string& owner) override {
    return inner_.NextSubscriptionId(tx, owner);
  }
  capacity::db::Result InsertSubscription(capacity::db::Transaction& tx, const capacity::db::model::SubscriptionRecord& r) override {
    return inner_.InsertSubscription(tx, r);
  }
  std::optional<capacity::db::model::SubscriptionRecord> GetSubscription(capacity::db::Transaction& tx, const std::string& owner,
                                                                         uint32_t local_id) override {
    return inner_.GetSubscription(tx, owner, local_id);
  }
  std::vector<capacity::db::model::SubscriptionRecord> ListSubscriptions(capacity::db::Transaction& tx, const std::string& owner) override {
    return inner_.ListSubscriptions(tx, owner);
  }
  std::vector<capacity::db::model::SubscriptionRecord> ListAllSubscriptions(capacity::db::Transaction& tx) override {
    return inner_.ListAllSubscriptions(tx);
  }
  capacity::db::Result UpdateSubscription(capacity::db::Transaction& tx, const capacity::db::model::SubscriptionRecord& r) override {
    return inner_.UpdateSubscription(tx, r);
  }
  capacity::db::Result DeleteSubscription(capacity::db::Transaction& tx, const std::string& owner, uint32_t local_id) override {
    return inner_.DeleteSubscription(tx, owner, local_id);
  }
  capacity::db::Result InsertLockedAssets(capacity::db::Transaction& tx, const capacity::db::model::LockedAssetsRecord& r) override {
    return inner_.InsertLockedAssets(tx, r);
  }
  std::optional<capacity::db::model::LockedAssetsRecord> GetLockedAssets(capacity::db::Transaction& tx, const std::string& owner,
                                                                         uint32_t local_id) override {
    return inner_.GetLockedAssets(tx, owner, local_id);
  }
  std::vector<capacity::db::model::LockedAssetsRecord> ListLockedAssets(capacity::db::Transaction& tx) override {
    ++scans;
    return inner_.ListLockedAssets(tx);
  }
  capacity::db::Result DeleteLockedAssets(capacity::db::Transaction& tx, const std::string& owner, uint32_t local_id) override {
    return inner_.DeleteLockedAssets(tx, owner, local_id);
  }

  int scans = 0;

 private:
  capacity::db::memory::MemoryRepository inner_;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestLockConvertsAmountAndAccrues() {
  Fixture f;

  const auto sub = f.locks.StartLifetime(Origin::Signed("alice"), 500);
  assert(sub.owner == "alice");
  assert(sub.local_id == 0);
  assert(sub.mode == SubscriptionMode::Lifetime(50'000));
  assert(sub.free_weight == 0);
  assert(!sub.expiration_time_ms);

  assert(f.currency->FreeBalance("alice") == 9'500);
  assert(f.currency->FreeBalance("capacity/lock") == 500);
  assert(f.locks.GetLocked("alice", 0)->amount == 500);
  assert(f.locks.LockedTotal() == 500);

  capacity::core::QuotaAccountant quota({});
  const auto                      accrued = quota.Accrue(sub, kStart + 2'000);
  assert(accrued.free_weight == 3'547);

  const auto events = f.events->Drain();
  assert(events.size() == 1);
  assert(events[0].kind() == v1::EVENT_KIND_SUBSCRIPTION_ACTIVATED);
  assert(events[0].amount() == 500);
}

void TestUnlockRefundsAndRemovesBothRows() {
  Fixture    f;
  const auto sub = f.locks.StartLifetime(Origin::Signed("alice"), 500);

  // someone else cannot unlock alice's deposit: the lookup is by caller
  assert(Throws<capacity::util::NotFound>([&] { f.locks.StopLifetime(Origin::Signed("bob"), sub.local_id); }));

  f.locks.StopLifetime(Origin::Signed("alice"), sub.local_id);
  assert(f.currency->FreeBalance("alice") == 10'000);
  assert(f.currency->FreeBalance("capacity/lock") == 0);
  assert(!f.locks.GetLocked("alice", sub.local_id));
  assert(f.locks.LockedTotal() == 0);

  auto tx = f.repository->Begin();
  assert(!f.repository->GetSubscription(*tx, "alice", sub.local_id));
  tx->Rollback();

  assert(Throws<capacity::util::NotFound>([&] { f.locks.StopLifetime(Origin::Signed("alice"), sub.local_id); }));

  const auto events = f.events->Drain();
  assert(events.back().kind() == v1::EVENT_KIND_SUBSCRIPTION_STOPPED);
  assert(events.back().amount() == 500);
}

void TestRelockReproducesEquivalentSubscription() {
  Fixture    f;
  const auto first = f.locks.StartLifetime(Origin::Signed("alice"), 777);
  f.locks.StopLifetime(Origin::Signed("alice"), first.local_id);
  const auto second = f.locks.StartLifetime(Origin::Signed("alice"), 777);

  assert(second.mode == first.mode);
  assert(second.free_weight == 0);
  assert(second.local_id == first.local_id + 1);
  assert(f.locks.LockedTotal() == 777);
}

void TestAuctionSubscriptionIsNotLockBacked() {
  Fixture f;
  f.currency->Deposit("bob", 1'000);

  capacity::core::AuctionManager auctions(f.repository, f.currency, f.events, f.clock, {});
  const auto                     id = auctions.StartAuction(Origin::Root(), SubscriptionMode::Daily(1));
  auctions.Bid(Origin::Signed("bob"), id, 200);
  f.clock->Advance(auctions.options().duration_ms + 1);
  const auto sub = auctions.Claim(Origin::Signed("bob"), id, std::nullopt);

  assert(Throws<capacity::util::NotLockBacked>([&] { f.locks.StopLifetime(Origin::Signed("bob"), sub.local_id); }));

  auto tx = f.repository->Begin();
  assert(f.repository->GetSubscription(*tx, "bob", sub.local_id));
  tx->Rollback();
}

void TestInvalidAmounts() {
  Fixture f;
  assert(Throws<capacity::util::InvalidAmount>([&] { f.locks.StartLifetime(Origin::Signed("alice"), 0); }));

  Fixture tiny(AssetLockAccountant::Options{{1, 1'000}, "capacity/lock"});
  assert(Throws<capacity::util::InvalidAmount>([&] { tiny.locks.StartLifetime(Origin::Signed("alice"), 999); }));
  assert(tiny.locks.StartLifetime(Origin::Signed("alice"), 1'000).mode == SubscriptionMode::Lifetime(1));

  // 100 uTPS per unit: anything above u32::MAX / 100 units does not fit
  assert(!f.locks.TpsFor(std::numeric_limits<uint32_t>::max() / 100 + 1));
  assert(f.locks.TpsFor(std::numeric_limits<uint32_t>::max() / 100));
  f.currency->Deposit("whale", std::numeric_limits<uint32_t>::max());
  assert(Throws<capacity::util::InvalidAmount>([&] { f.locks.StartLifetime(Origin::Signed("whale"), std::numeric_limits<uint32_t>::max()); }));
  assert(f.currency->FreeBalance("whale") == std::numeric_limits<uint32_t>::max());

  assert(f.locks.LockedTotal() == 0);
  assert(f.events->Size() == 0);
}

void TestUnfundedLockLeavesNoRows() {
  Fixture f;
  assert(Throws<capacity::util::ResourceExhausted>([&] { f.locks.StartLifetime(Origin::Signed("bob"), 100); }));

  auto tx = f.repository->Begin();
  assert(f.repository->ListSubscriptions(*tx, "bob").empty());
  assert(f.repository->ListLockedAssets(*tx).empty());
  // the aborted attempt did not consume an id
  assert(f.repository->NextSubscriptionId(*tx, "bob") == 0);
  tx->Rollback();
}

void TestRootCannotLock() {
  Fixture f;
  assert(Throws<capacity::util::BadOrigin>([&] { f.locks.StartLifetime(Origin::Root(), 100); }));
  assert(Throws<capacity::util::BadOrigin>([&] { f.locks.StopLifetime(Origin::Root(), 0); }));
}

void TestLockAndUnlockDoNotScanLocks() {
  auto repository = std::make_shared<ScanCountingRepository>();
  auto currency   = std::make_shared<capacity::currency::MemoryCurrency>();
  auto events     = std::make_shared<capacity::events::EventLog>();
  auto clock      = std::make_shared<capacity::util::ManualTimeSource>(kStart);
  currency->Deposit("alice", 10'000);
  AssetLockAccountant locks(repository, currency, events, clock, AssetLockAccountant::Options{});

  for (int i = 0; i < 3; ++i) {
    locks.StartLifetime(Origin::Signed("alice"), 100);
  }
  locks.StopLifetime(Origin::Signed("alice"), 1);
  assert(repository->scans == 0);

  assert(locks.LockedTotal() == 200);
  assert(repository->scans == 1);
}

} // namespace

int main() {
  TestLockAndUnlockDoNotScanLocks();
  TestLockConvertsAmountAndAccrues();
  TestUnlockRefundsAndRemovesBothRows();
  TestRelockReproducesEquivalentSubscription();
  TestAuctionSubscriptionIsNotLockBacked();
  TestInvalidAmounts();
  TestUnfundedLockLeavesNoRows();
  TestRootCannotLock();

  std::cout << "capacity_manager_unit_asset_lock_accountant: pass\n";
  return 0;
}
