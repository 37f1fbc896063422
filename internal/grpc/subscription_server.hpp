#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "capacity/manager/v1.hpp"
#include "internal/service/subscription_service.hpp"

namespace capacity::grpc {

class SubscriptionServer final : public capacity::manager::v1::CapacitySubscriptionService::Service {
 public:
  explicit SubscriptionServer(std::shared_ptr<capacity::service::SubscriptionService> svc);

  ::grpc::Status StartLifetime(::grpc::ServerContext*, const capacity::manager::v1::StartLifetimeRequest*,
                               capacity::manager::v1::StartLifetimeResponse*) override;

  ::grpc::Status StopLifetime(::grpc::ServerContext*, const capacity::manager::v1::StopLifetimeRequest*, google::protobuf::Empty*) override;

  ::grpc::Status GetSubscription(::grpc::ServerContext*, const capacity::manager::v1::GetSubscriptionRequest*,
                                 capacity::manager::v1::GetSubscriptionResponse*) override;

  ::grpc::Status ListSubscriptions(::grpc::ServerContext*, const capacity::manager::v1::ListSubscriptionsRequest*,
                                   capacity::manager::v1::ListSubscriptionsResponse*) override;

  ::grpc::Status Validate(::grpc::ServerContext*, const capacity::manager::v1::ExemptionRequest*, capacity::manager::v1::ValidateResponse*) override;

  ::grpc::Status PreDispatch(::grpc::ServerContext*, const capacity::manager::v1::ExemptionRequest*,
                             capacity::manager::v1::PreDispatchResponse*) override;

  ::grpc::Status PostDispatch(::grpc::ServerContext*, const capacity::manager::v1::PostDispatchRequest*,
                              capacity::manager::v1::PostDispatchResponse*) override;

  ::grpc::Status Call(::grpc::ServerContext*, const capacity::manager::v1::ExemptionRequest*, capacity::manager::v1::CallResponse*) override;

 private:
  std::shared_ptr<capacity::service::SubscriptionService> service_;
};

} // namespace capacity::grpc
