#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/origin.hpp"
#include "internal/model/subscription_mode.hpp"
#include "internal/util/time.hpp"

namespace capacity::currency {
class Currency;
}
namespace capacity::events {
class EventSink;
}

namespace capacity::core {

/*
  AuctionManager

  Ascending single-round auctions, one per subscription on offer.

    start_auction (root)  -> Open
    first bid             -> Bidding, window opens at the bid time
    window elapsed        -> Closed (derived from the clock, never stored)
    claim (winner)        -> Claimed, terminal

  Bids reserve the bid amount; outbid deposits are released. Claiming burns
  the winning deposit and creates the subscription.
*/
class AuctionManager {
 public:
  struct Options {
    uint64_t duration_ms = 100'000;
    uint64_t minimal_bid = 100;
  };

  AuctionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<currency::Currency> currency,
                 std::shared_ptr<events::EventSink> events, std::shared_ptr<const util::TimeSource> clock, Options options);

  uint32_t StartAuction(const model::Origin& origin, const model::SubscriptionMode& mode);

  db::model::AuctionRecord Bid(const model::Origin& origin, uint32_t auction_id, uint64_t amount);

  // Returns the created subscription.
  db::model::SubscriptionRecord Claim(const model::Origin& origin, uint32_t auction_id, const std::optional<std::string>& beneficiary);

  db::model::AuctionRecord              Get(uint32_t auction_id);
  std::vector<db::model::AuctionRecord> List();

  model::AuctionState StateOf(const db::model::AuctionRecord& auction) const;

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
