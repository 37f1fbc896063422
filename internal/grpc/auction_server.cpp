#include "auction_server.hpp"

#include "grpc_error.hpp"

namespace capacity::grpc {

using namespace capacity::manager::v1;

AuctionServer::AuctionServer(std::shared_ptr<capacity::service::AuctionService> svc) : service_(std::move(svc)) {
}

::grpc::Status AuctionServer::StartAuction(::grpc::ServerContext*, const StartAuctionRequest* req, StartAuctionResponse* resp) {
  try {
    *resp = service_->StartAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::Bid(::grpc::ServerContext*, const BidRequest* req, BidResponse* resp) {
  try {
    *resp = service_->Bid(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::Claim(::grpc::ServerContext*, const ClaimRequest* req, ClaimResponse* resp) {
  try {
    *resp = service_->Claim(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::GetAuction(::grpc::ServerContext*, const GetAuctionRequest* req, GetAuctionResponse* resp) {
  try {
    *resp = service_->GetAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace capacity::grpc
