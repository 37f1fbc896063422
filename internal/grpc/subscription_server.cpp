#include "subscription_server.hpp"

#include "grpc_error.hpp"

namespace capacity::grpc {

using namespace capacity::manager::v1;

SubscriptionServer::SubscriptionServer(std::shared_ptr<capacity::service::SubscriptionService> svc) : service_(std::move(svc)) {
}

::grpc::Status SubscriptionServer::StartLifetime(::grpc::ServerContext*, const StartLifetimeRequest* req, StartLifetimeResponse* resp) {
  try {
    *resp = service_->StartLifetime(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SubscriptionServer::StopLifetime(::grpc::ServerContext*, const StopLifetimeRequest* req, google::protobuf::Empty*) {
  try {
    service_->StopLifetime(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SubscriptionServer::GetSubscription(::grpc::ServerContext*, const GetSubscriptionRequest* req, GetSubscriptionResponse* resp) {
  try {
    *resp = service_->GetSubscription(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SubscriptionServer::ListSubscriptions(::grpc::ServerContext*, const ListSubscriptionsRequest* req, ListSubscriptionsResponse* resp) {
  try {
    *resp = service_->ListSubscriptions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SubscriptionServer::Validate(::grpc::ServerContext*, const ExemptionRequest* req, ValidateResponse* resp) {
  try {
    *resp = service_->Validate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SubscriptionServer::PreDispatch(::grpc::ServerContext*, const ExemptionRequest* req, PreDispatchResponse* resp) {
  try {
    *resp = service_->PreDispatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SubscriptionServer::PostDispatch(::grpc::ServerContext*, const PostDispatchRequest* req, PostDispatchResponse* resp) {
  try {
    *resp = service_->PostDispatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SubscriptionServer::Call(::grpc::ServerContext*, const ExemptionRequest* req, CallResponse* resp) {
  try {
    *resp = service_->Call(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace capacity::grpc
