#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/origin.hpp"
#include "internal/util/rational.hpp"
#include "internal/util/time.hpp"

namespace capacity::currency {
class Currency;
}
namespace capacity::events {
class EventSink;
}

namespace capacity::core {

/*
  AssetLockAccountant

  Lock path: a deposit moves into the custodial account and buys a Lifetime
  subscription at tps = floor(amount * ratio). The deposit is returned in
  full by StopLifetime; the subscription and its LockedAssets row live and
  die together.
*/
class AssetLockAccountant {
 public:
  struct Options {
    // uTPS per locked unit
    util::Rational ratio{100, 1};
    std::string    custodial_account = "capacity/lock";
  };

  AssetLockAccountant(std::shared_ptr<db::Repository> repository, std::shared_ptr<currency::Currency> currency,
                      std::shared_ptr<events::EventSink> events, std::shared_ptr<const util::TimeSource> clock, Options options);

  // Throws InvalidAmount when the amount or the derived rate is zero, or the
  // rate does not fit in 32 bits.
  db::model::SubscriptionRecord StartLifetime(const model::Origin& origin, uint64_t amount);

  // Refunds the deposit. Throws NotFound or NotLockBacked.
  void StopLifetime(const model::Origin& origin, uint32_t local_id);

  std::optional<db::model::LockedAssetsRecord> GetLocked(const std::string& owner, uint32_t local_id);

  // Sum of all locked deposits; scans every lock.
  uint64_t LockedTotal();

  // Throughput granted for `amount`, or nullopt if it is not a valid lock.
  std::optional<uint32_t> TpsFor(uint64_t amount) const;

  const Options& options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<currency::Currency>     currency_;
  std::shared_ptr<events::EventSink>      events_;
  std::shared_ptr<const util::TimeSource> clock_;
  Options                                 options_;
};

} // namespace capacity::core
