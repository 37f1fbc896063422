#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/auction_state.hpp"
#include "internal/model/subscription_mode.hpp"

namespace capacity::db::model {

/*
  Persistent auction row.

  IMPORTANT:
  - `winner` and `best_price` always change together.
  - Once `subscription_id` is set the row is terminal.
  - Rows are never deleted.
*/

struct AuctionRecord {
  uint32_t id = 0;

  capacity::model::SubscriptionMode mode;

  std::optional<std::string> winner;
  uint64_t                   best_price = 0;

  // unix ms of the first accepted bid; opens the bidding window
  std::optional<uint64_t> first_bid_time_ms;

  std::optional<uint32_t> subscription_id;
};

// Window closes strictly after first_bid_time + duration.
inline bool IsWindowClosed(const AuctionRecord& auction, uint64_t now_ms, uint64_t duration_ms) {
  if (!auction.first_bid_time_ms) {
    return false;
  }
  const uint64_t first = *auction.first_bid_time_ms;
  return duration_ms <= UINT64_MAX - first && first + duration_ms < now_ms;
}

inline capacity::model::AuctionState StateAt(const AuctionRecord& auction, uint64_t now_ms, uint64_t duration_ms) {
  using capacity::model::AuctionState;
  if (auction.subscription_id) return AuctionState::kClaimed;
  if (!auction.winner) return AuctionState::kOpen;
  if (IsWindowClosed(auction, now_ms, duration_ms)) return AuctionState::kClosed;
  return AuctionState::kBidding;
}

} // namespace capacity::db::model
