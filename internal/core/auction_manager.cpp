#include "internal/core/auction_manager.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/core/quota_accountant.hpp"
#include "internal/currency/currency.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace capacity::core {

using capacity::manager::v1::Event;
using capacity::manager::v1::EVENT_KIND_AUCTION_FINISHED;
using capacity::manager::v1::EVENT_KIND_AUCTION_STARTED;
using capacity::manager::v1::EVENT_KIND_NEW_BID;
using capacity::manager::v1::EVENT_KIND_SUBSCRIPTION_ACTIVATED;

namespace {

std::string AuctionName(uint32_t id) {
  return "auction " + std::to_string(id);
}

} // namespace

AuctionManager::AuctionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<currency::Currency> currency,
                               std::shared_ptr<events::EventSink> events, std::shared_ptr<const util::TimeSource> clock, Options options)
    : repository_(std::move(repository)),
      currency_(std::move(currency)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      options_(options) {
}

model::AuctionState AuctionManager::StateOf(const db::model::AuctionRecord& auction) const {
  return db::model::StateAt(auction, clock_->NowMillis(), options_.duration_ms);
}

uint32_t AuctionManager::StartAuction(const model::Origin& origin, const model::SubscriptionMode& mode) {
  model::EnsureRoot(origin, "start auction");

  auto tx = repository_->Begin();

  db::model::AuctionRecord auction;
  auction.id   = repository_->NextAuctionId(*tx);
  auction.mode = mode;
  ThrowIfDbError(repository_->InsertAuction(*tx, auction), "start auction");
  tx->Commit();

  Event event;
  event.set_kind(EVENT_KIND_AUCTION_STARTED);
  event.set_auction_id(auction.id);
  event.set_timestamp_ms(clock_->NowMillis());
  events_->Publish(event);
  return auction.id;
}

db::model::AuctionRecord AuctionManager::Bid(const model::Origin& origin, uint32_t auction_id, uint64_t amount) {
  const auto& bidder = model::EnsureSigned(origin, "bid");
  const auto  now    = clock_->NowMillis();

  auto tx      = repository_->Begin();
  auto auction = repository_->GetAuction(*tx, auction_id);
  if (!auction) throw util::NotFound("bid: " + AuctionName(auction_id) + " not found");
  if (auction->subscription_id) throw util::AlreadyClaimed("bid: " + AuctionName(auction_id) + " already claimed");
  if (db::model::IsWindowClosed(*auction, now, options_.duration_ms)) {
    throw util::BiddingClosed("bid: bidding window of " + AuctionName(auction_id) + " has closed");
  }

  if (!auction->winner) {
    if (amount < options_.minimal_bid) {
      throw util::BidTooLow("bid: first bid " + std::to_string(amount) + " below minimal bid " + std::to_string(options_.minimal_bid));
    }
  } else if (amount <= auction->best_price) {
    throw util::BidTooLow("bid: " + std::to_string(amount) + " does not exceed best price " + std::to_string(auction->best_price));
  }

  const auto previous_winner = auction->winner;
  const auto previous_price  = auction->best_price;

  // a failed reserve leaves everything untouched
  currency_->Reserve(bidder, amount);

  auction->winner     = bidder;
  auction->best_price = amount;
  if (!auction->first_bid_time_ms) {
    auction->first_bid_time_ms = now;
  }

  try {
    ThrowIfDbError(repository_->UpdateAuction(*tx, *auction), "bid");
    tx->Commit();
  } catch (const std::exception&) {
    currency_->Unreserve(bidder, amount);
    throw;
  }

  if (previous_winner) {
    if (const auto missing = currency_->Unreserve(*previous_winner, previous_price); missing != 0) {
      CAPACITY_LOG_WARN("outbid deposit only partially released",
                        {observability::StringField("account", *previous_winner), observability::UintField("missing", missing)});
    }
  }

  Event event;
  event.set_kind(EVENT_KIND_NEW_BID);
  event.set_account(bidder);
  event.set_auction_id(auction_id);
  event.set_amount(amount);
  event.set_timestamp_ms(now);
  events_->Publish(event);
  return *auction;
}

db::model::SubscriptionRecord AuctionManager::Claim(const model::Origin& origin, uint32_t auction_id, const std::optional<std::string>& beneficiary) {
  const auto& caller = model::EnsureSigned(origin, "claim");
  if (beneficiary && beneficiary->empty()) {
    throw util::BadOrigin("claim: beneficiary account must not be empty");
  }
  const auto  now    = clock_->NowMillis();

  auto tx      = repository_->Begin();
  auto auction = repository_->GetAuction(*tx, auction_id);
  if (!auction) throw util::NotFound("claim: " + AuctionName(auction_id) + " not found");
  if (auction->subscription_id) throw util::AlreadyClaimed("claim: " + AuctionName(auction_id) + " already claimed");
  if (!auction->winner || *auction->winner != caller) {
    throw util::BadOrigin("claim: " + caller + " is not the winner of " + AuctionName(auction_id));
  }
  if (!db::model::IsWindowClosed(*auction, now, options_.duration_ms)) {
    throw util::InvalidState("claim: bidding window of " + AuctionName(auction_id) + " is still open");
  }

  db::model::SubscriptionRecord subscription;
  subscription.owner              = beneficiary.value_or(caller);
  subscription.local_id           = repository_->NextSubscriptionId(*tx, subscription.owner);
  subscription.free_weight        = 0;
  subscription.mode               = auction->mode;
  subscription.issue_time_ms      = now;
  subscription.last_update_ms     = now;
  subscription.expiration_time_ms = QuotaAccountant::ExpirationFor(auction->mode, now);
  ThrowIfDbError(repository_->InsertSubscription(*tx, subscription), "claim");

  auction->subscription_id = subscription.local_id;
  ThrowIfDbError(repository_->UpdateAuction(*tx, *auction), "claim");

  currency_->BurnReserved(caller, auction->best_price);
  try {
    tx->Commit();
  } catch (const std::exception& e) {
    CAPACITY_LOG_ERROR("claim commit failed after burning the winning bid",
                       {observability::UintField("auction_id", auction_id), observability::StringField("account", caller),
                        observability::UintField("amount", auction->best_price), observability::StringField("error", e.what())});
    throw;
  }

  Event finished;
  finished.set_kind(EVENT_KIND_AUCTION_FINISHED);
  finished.set_account(caller);
  finished.set_auction_id(auction_id);
  finished.set_local_id(subscription.local_id);
  finished.set_amount(auction->best_price);
  finished.set_timestamp_ms(now);
  events_->Publish(finished);

  Event activated;
  activated.set_kind(EVENT_KIND_SUBSCRIPTION_ACTIVATED);
  activated.set_account(subscription.owner);
  activated.set_auction_id(auction_id);
  activated.set_local_id(subscription.local_id);
  activated.set_timestamp_ms(now);
  events_->Publish(activated);
  return subscription;
}

db::model::AuctionRecord AuctionManager::Get(uint32_t auction_id) {
  auto tx      = repository_->Begin();
  auto auction = repository_->GetAuction(*tx, auction_id);
  tx->Rollback();
  if (!auction) throw util::NotFound(AuctionName(auction_id) + " not found");
  return *auction;
}

std::vector<db::model::AuctionRecord> AuctionManager::List() {
  auto tx       = repository_->Begin();
  auto auctions = repository_->ListAuctions(*tx);
  tx->Rollback();
  return auctions;
}

} // namespace capacity::core
