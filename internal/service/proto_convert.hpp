#pragma once

#include <optional>

#include "capacity/manager/v1.hpp"
#include "internal/core/request_interceptor.hpp"
#include "internal/db/model/auction_record.hpp"
#include "internal/db/model/subscription_record.hpp"
#include "internal/model/origin.hpp"
#include "internal/model/subscription_mode.hpp"

namespace capacity::service {

/*
  Conversions between wire messages and core types. Malformed input throws
  std::invalid_argument; a missing origin throws BadOrigin.
*/

capacity::model::Origin ToOrigin(const capacity::manager::v1::Origin& origin);

capacity::model::SubscriptionMode ToMode(const capacity::manager::v1::SubscriptionMode& mode);
capacity::manager::v1::SubscriptionMode ToProto(const capacity::model::SubscriptionMode& mode);
capacity::manager::v1::AuctionState ToProto(capacity::model::AuctionState state);
capacity::manager::v1::Auction ToProto(const capacity::db::model::AuctionRecord& auction, capacity::model::AuctionState state);
capacity::manager::v1::Subscription ToProto(const capacity::db::model::SubscriptionRecord& subscription, std::optional<uint64_t> locked_amount);
capacity::manager::v1::ExemptionContext ToProto(const capacity::core::ExemptionContext& context);
capacity::core::ExemptionContext FromProto(const capacity::manager::v1::ExemptionContext& context);
capacity::core::ExemptionRequest FromProto(const capacity::manager::v1::ExemptionRequest& request);

} // namespace capacity::service
