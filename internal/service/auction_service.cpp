#include "auction_service.hpp"

#include <optional>

#include "internal/core/auction_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace capacity::service {

using namespace capacity::manager::v1;

AuctionService::AuctionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartAuctionResponse AuctionService::StartAuction(const StartAuctionRequest& req) {
  return ObserveRpc("AuctionService.StartAuction", [&] {
    const auto origin = ToOrigin(req.origin());
    const auto mode   = ToMode(req.mode());

    std::lock_guard lock(*ctx_.ordering);
    StartAuctionResponse resp;
    resp.set_auction_id(ctx_.auctions->StartAuction(origin, mode));
    return resp;
  });
}

BidResponse AuctionService::Bid(const BidRequest& req) {
  return ObserveRpc("AuctionService.Bid", [&] {
    const auto origin = ToOrigin(req.origin());

    std::lock_guard lock(*ctx_.ordering);
    const auto  auction = ctx_.auctions->Bid(origin, req.auction_id(), req.amount());
    BidResponse resp;
    *resp.mutable_auction() = ToProto(auction, ctx_.auctions->StateOf(auction));
    return resp;
  });
}

ClaimResponse AuctionService::Claim(const ClaimRequest& req) {
  return ObserveRpc("AuctionService.Claim", [&] {
    const auto                 origin = ToOrigin(req.origin());
    std::optional<std::string> beneficiary;
    if (req.has_beneficiary()) {
      if (req.beneficiary().empty()) {
        throw util::BadOrigin("claim: beneficiary account must not be empty");
      }
      beneficiary = req.beneficiary();
    }

    std::lock_guard lock(*ctx_.ordering);
    const auto    subscription = ctx_.auctions->Claim(origin, req.auction_id(), beneficiary);
    ClaimResponse resp;
    resp.mutable_subscription()->set_owner(subscription.owner);
    resp.mutable_subscription()->set_local_id(subscription.local_id);
    return resp;
  });
}

GetAuctionResponse AuctionService::GetAuction(const GetAuctionRequest& req) {
  return ObserveRpc("AuctionService.GetAuction", [&] {
    const auto         auction = ctx_.auctions->Get(req.auction_id());
    GetAuctionResponse resp;
    *resp.mutable_auction() = ToProto(auction, ctx_.auctions->StateOf(auction));
    return resp;
  });
}

} // namespace capacity::service
