#pragma once

#include "capacity/manager/v1.hpp"
#include "service_context.hpp"

namespace capacity::service {

class AuctionService {
 public:
  explicit AuctionService(ServiceContext ctx);

  capacity::manager::v1::StartAuctionResponse StartAuction(const capacity::manager::v1::StartAuctionRequest& req);

  capacity::manager::v1::BidResponse Bid(const capacity::manager::v1::BidRequest& req);

  capacity::manager::v1::ClaimResponse Claim(const capacity::manager::v1::ClaimRequest& req);

  capacity::manager::v1::GetAuctionResponse GetAuction(const capacity::manager::v1::GetAuctionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace capacity::service
