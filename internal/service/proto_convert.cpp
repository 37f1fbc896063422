#include "proto_convert.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace capacity::service {

namespace v1 = capacity::manager::v1;

capacity::model::Origin ToOrigin(const v1::Origin& origin) {
  switch (origin.kind_case()) {
    case v1::Origin::kRoot:
      if (!origin.root()) break;
      return capacity::model::Origin::Root();
    case v1::Origin::kSigned:
      if (origin.signed_().empty()) break;
      return capacity::model::Origin::Signed(origin.signed_());
    default:
      break;
  }
  throw capacity::util::BadOrigin("request carries no origin");
}

capacity::model::SubscriptionMode ToMode(const v1::SubscriptionMode& mode) {
  switch (mode.kind_case()) {
    case v1::SubscriptionMode::kLifetime:
      return capacity::model::SubscriptionMode::Lifetime(mode.lifetime().tps());
    case v1::SubscriptionMode::kDaily:
      return capacity::model::SubscriptionMode::Daily(mode.daily().days());
    default:
      throw std::invalid_argument("subscription mode is required");
  }
}

v1::SubscriptionMode ToProto(const capacity::model::SubscriptionMode& mode) {
  v1::SubscriptionMode out;
  if (mode.IsLifetime()) {
    out.mutable_lifetime()->set_tps(mode.value);
  } else {
    out.mutable_daily()->set_days(mode.value);
  }
  return out;
}

v1::AuctionState ToProto(capacity::model::AuctionState state) {
  using capacity::model::AuctionState;
  switch (state) {
    case AuctionState::kOpen:
      return v1::AUCTION_STATE_OPEN;
    case AuctionState::kBidding:
      return v1::AUCTION_STATE_BIDDING;
    case AuctionState::kClosed:
      return v1::AUCTION_STATE_CLOSED;
    case AuctionState::kClaimed:
      return v1::AUCTION_STATE_CLAIMED;
    default:
      return v1::AUCTION_STATE_UNSPECIFIED;
  }
}

v1::Auction ToProto(const capacity::db::model::AuctionRecord& auction, capacity::model::AuctionState state) {
  v1::Auction out;
  out.set_id(auction.id);
  *out.mutable_mode() = ToProto(auction.mode);
  if (auction.winner) out.set_winner(*auction.winner);
  out.set_best_price(auction.best_price);
  if (auction.first_bid_time_ms) out.set_first_bid_time_ms(*auction.first_bid_time_ms);
  if (auction.subscription_id) out.set_subscription_id(*auction.subscription_id);
  out.set_state(ToProto(state));
  return out;
}

v1::Subscription ToProto(const capacity::db::model::SubscriptionRecord& subscription, std::optional<uint64_t> locked_amount) {
  v1::Subscription out;
  out.mutable_key()->set_owner(subscription.owner);
  out.mutable_key()->set_local_id(subscription.local_id);
  out.set_free_weight(subscription.free_weight);
  *out.mutable_mode() = ToProto(subscription.mode);
  out.set_issue_time_ms(subscription.issue_time_ms);
  out.set_last_update_ms(subscription.last_update_ms);
  if (subscription.expiration_time_ms) out.set_expiration_time_ms(*subscription.expiration_time_ms);
  if (locked_amount) out.set_locked_amount(*locked_amount);
  return out;
}

v1::ExemptionContext ToProto(const capacity::core::ExemptionContext& context) {
  v1::ExemptionContext out;
  out.set_pays_no_fee(context.pays_no_fee);
  out.set_reservation_id(context.reservation_id);
  out.set_signer(context.signer);
  out.mutable_subscription()->set_owner(context.owner);
  out.mutable_subscription()->set_local_id(context.local_id);
  out.set_estimated_cost(context.estimated_cost);
  return out;
}

capacity::core::ExemptionContext FromProto(const v1::ExemptionContext& context) {
  capacity::core::ExemptionContext out;
  out.pays_no_fee    = context.pays_no_fee();
  out.reservation_id = context.reservation_id();
  out.signer         = context.signer();
  out.owner          = context.subscription().owner();
  out.local_id       = context.subscription().local_id();
  out.estimated_cost = context.estimated_cost();
  return out;
}

capacity::core::ExemptionRequest FromProto(const v1::ExemptionRequest& request) {
  capacity::core::ExemptionRequest out;
  out.origin   = ToOrigin(request.origin());
  if (request.has_owner()) out.owner = request.owner();
  out.local_id = request.local_id();

  const auto& operation        = request.operation();
  out.operation.name           = operation.name();
  out.operation.payload        = operation.payload();
  out.operation.estimated_cost = operation.estimated_cost();
  return out;
}

} // namespace capacity::service
