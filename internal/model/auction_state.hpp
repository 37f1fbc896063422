#pragma once

#include <cstdint>
#include <string_view>

namespace capacity::model {

/*
  Auction lifecycle. Derived from the stored record and the clock, never
  stored itself:

    Open     no bid yet
    Bidding  has a winner, window still open
    Closed   window elapsed, not claimed
    Claimed  subscription issued (terminal)
*/
enum class AuctionState : std::uint8_t {
  kUnspecified = 0,
  kOpen        = 1,
  kBidding     = 2,
  kClosed      = 3,
  kClaimed     = 4,
};

constexpr bool IsTerminal(AuctionState state) {
  return state == AuctionState::kClaimed;
}

constexpr bool AcceptsBids(AuctionState state) {
  return state == AuctionState::kOpen || state == AuctionState::kBidding;
}

constexpr bool CanTransition(AuctionState from, AuctionState to) {
  if (from == to) {
    return !IsTerminal(from);
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == AuctionState::kUnspecified || to == AuctionState::kOpen) {
    return false;
  }
  if (to == AuctionState::kClaimed) {
    return from == AuctionState::kClosed;
  }

  return static_cast<std::uint8_t>(to) >= static_cast<std::uint8_t>(from);
}

constexpr std::string_view ToString(AuctionState state) {
  switch (state) {
    case AuctionState::kOpen:
      return "open";
    case AuctionState::kBidding:
      return "bidding";
    case AuctionState::kClosed:
      return "closed";
    case AuctionState::kClaimed:
      return "claimed";
    case AuctionState::kUnspecified:
    default:
      return "unspecified";
  }
}

} // namespace capacity::model
