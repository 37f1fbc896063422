#include "internal/core/asset_lock_accountant.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "internal/core/db_errors.hpp"
#include "internal/currency/currency.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/saturating.hpp"

namespace capacity::core {

using capacity::manager::v1::Event;
using capacity::manager::v1::EVENT_KIND_SUBSCRIPTION_ACTIVATED;
using capacity::manager::v1::EVENT_KIND_SUBSCRIPTION_STOPPED;

AssetLockAccountant::AssetLockAccountant(std::shared_ptr<db::Repository> repository, std::shared_ptr<currency::Currency> currency,
                                         std::shared_ptr<events::EventSink> events, std::shared_ptr<const util::TimeSource> clock,
                                         Options options)
    : repository_(std::move(repository)),
      currency_(std::move(currency)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      options_(std::move(options)) {
  if (!options_.ratio.IsValid()) {
    throw std::invalid_argument("asset lock: ratio denominator must be non-zero");
  }
  if (options_.custodial_account.empty()) {
    throw std::invalid_argument("asset lock: custodial account required");
  }
}

std::optional<uint32_t> AssetLockAccountant::TpsFor(uint64_t amount) const {
  if (amount == 0) return std::nullopt;
  const auto tps = options_.ratio.MulFloor(amount);
  if (!tps || *tps == 0 || *tps > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(*tps);
}

db::model::SubscriptionRecord AssetLockAccountant::StartLifetime(const model::Origin& origin, uint64_t amount) {
  const auto& caller = model::EnsureSigned(origin, "start lifetime");
  if (caller == options_.custodial_account) {
    throw util::BadOrigin("start lifetime: custodial account cannot lock");
  }

  const auto tps = TpsFor(amount);
  if (!tps) {
    throw util::InvalidAmount("start lifetime: amount " + std::to_string(amount) + " does not convert to a valid rate");
  }

  const auto now = clock_->NowMillis();
  auto       tx  = repository_->Begin();

  db::model::SubscriptionRecord subscription;
  subscription.owner          = caller;
  subscription.local_id       = repository_->NextSubscriptionId(*tx, caller);
  subscription.mode           = model::SubscriptionMode::Lifetime(*tps);
  subscription.issue_time_ms  = now;
  subscription.last_update_ms = now;
  ThrowIfDbError(repository_->InsertSubscription(*tx, subscription), "start lifetime");
  ThrowIfDbError(repository_->InsertLockedAssets(*tx, {caller, subscription.local_id, amount}), "start lifetime");

  currency_->Transfer(caller, options_.custodial_account, amount);
  try {
    tx->Commit();
  } catch (const std::exception&) {
    currency_->Transfer(options_.custodial_account, caller, amount);
    throw;
  }

  observability::Metrics::Instance().AdjustLockedTotal(static_cast<std::int64_t>(amount));

  Event event;
  event.set_kind(EVENT_KIND_SUBSCRIPTION_ACTIVATED);
  event.set_account(caller);
  event.set_local_id(subscription.local_id);
  event.set_amount(amount);
  event.set_timestamp_ms(now);
  events_->Publish(event);
  return subscription;
}

void AssetLockAccountant::StopLifetime(const model::Origin& origin, uint32_t local_id) {
  const auto& caller = model::EnsureSigned(origin, "stop lifetime");
  const auto  key    = caller + "/" + std::to_string(local_id);

  auto tx = repository_->Begin();
  if (!repository_->GetSubscription(*tx, caller, local_id)) {
    throw util::NotFound("stop lifetime: subscription " + key + " not found");
  }
  const auto locked = repository_->GetLockedAssets(*tx, caller, local_id);
  if (!locked) {
    throw util::NotLockBacked("stop lifetime: subscription " + key + " is not lock-backed");
  }

  ThrowIfDbError(repository_->DeleteLockedAssets(*tx, caller, local_id), "stop lifetime");
  ThrowIfDbError(repository_->DeleteSubscription(*tx, caller, local_id), "stop lifetime");

  currency_->Transfer(options_.custodial_account, caller, locked->amount);
  try {
    tx->Commit();
  } catch (const std::exception&) {
    currency_->Transfer(caller, options_.custodial_account, locked->amount);
    throw;
  }

  observability::Metrics::Instance().AdjustLockedTotal(-static_cast<std::int64_t>(locked->amount));

  Event event;
  event.set_kind(EVENT_KIND_SUBSCRIPTION_STOPPED);
  event.set_account(caller);
  event.set_local_id(local_id);
  event.set_amount(locked->amount);
  event.set_timestamp_ms(clock_->NowMillis());
  events_->Publish(event);
}

std::optional<db::model::LockedAssetsRecord> AssetLockAccountant::GetLocked(const std::string& owner, uint32_t local_id) {
  auto tx     = repository_->Begin();
  auto locked = repository_->GetLockedAssets(*tx, owner, local_id);
  tx->Rollback();
  return locked;
}

uint64_t AssetLockAccountant::LockedTotal() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListLockedAssets(*tx);
  tx->Rollback();

  uint64_t total = 0;
  for (const auto& row : rows) {
    total = util::SaturatingAdd(total, row.amount);
  }
  return total;
}

} // namespace capacity::core
