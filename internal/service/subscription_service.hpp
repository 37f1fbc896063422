#pragma once

#include <google/protobuf/empty.pb.h>

#include "capacity/manager/v1.hpp"
#include "service_context.hpp"

namespace capacity::service {

/*
  Lock path, subscription queries and the fee-exemption pipeline.
*/
class SubscriptionService {
 public:
  explicit SubscriptionService(ServiceContext ctx);

  capacity::manager::v1::StartLifetimeResponse StartLifetime(const capacity::manager::v1::StartLifetimeRequest& req);
  void                                         StopLifetime(const capacity::manager::v1::StopLifetimeRequest& req);

  capacity::manager::v1::GetSubscriptionResponse   GetSubscription(const capacity::manager::v1::GetSubscriptionRequest& req);
  capacity::manager::v1::ListSubscriptionsResponse ListSubscriptions(const capacity::manager::v1::ListSubscriptionsRequest& req);

  capacity::manager::v1::ValidateResponse     Validate(const capacity::manager::v1::ExemptionRequest& req);
  capacity::manager::v1::PreDispatchResponse  PreDispatch(const capacity::manager::v1::ExemptionRequest& req);
  capacity::manager::v1::PostDispatchResponse PostDispatch(const capacity::manager::v1::PostDispatchRequest& req);
  capacity::manager::v1::CallResponse         Call(const capacity::manager::v1::ExemptionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace capacity::service
