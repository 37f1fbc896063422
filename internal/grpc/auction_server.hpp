#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "capacity/manager/v1.hpp"
#include "internal/service/auction_service.hpp"

namespace capacity::grpc {

class AuctionServer final : public capacity::manager::v1::CapacityAuctionService::Service {
 public:
  explicit AuctionServer(std::shared_ptr<capacity::service::AuctionService> svc);

  ::grpc::Status StartAuction(::grpc::ServerContext*, const capacity::manager::v1::StartAuctionRequest*,
                              capacity::manager::v1::StartAuctionResponse*) override;

  ::grpc::Status Bid(::grpc::ServerContext*, const capacity::manager::v1::BidRequest*, capacity::manager::v1::BidResponse*) override;

  ::grpc::Status Claim(::grpc::ServerContext*, const capacity::manager::v1::ClaimRequest*, capacity::manager::v1::ClaimResponse*) override;

  ::grpc::Status GetAuction(::grpc::ServerContext*, const capacity::manager::v1::GetAuctionRequest*,
                            capacity::manager::v1::GetAuctionResponse*) override;

 private:
  std::shared_ptr<capacity::service::AuctionService> service_;
};

} // namespace capacity::grpc
