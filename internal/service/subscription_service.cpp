#include "subscription_service.hpp"

#include <optional>

#include "internal/core/asset_lock_accountant.hpp"
#include "internal/core/request_interceptor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace capacity::service {

using namespace capacity::manager::v1;

SubscriptionService::SubscriptionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartLifetimeResponse SubscriptionService::StartLifetime(const StartLifetimeRequest& req) {
  return ObserveRpc("SubscriptionService.StartLifetime", [&] {
    const auto origin = ToOrigin(req.origin());

    std::lock_guard       lock(*ctx_.ordering);
    const auto            subscription = ctx_.locks->StartLifetime(origin, req.amount());
    StartLifetimeResponse resp;
    *resp.mutable_subscription() = ToProto(subscription, req.amount());
    return resp;
  });
}

void SubscriptionService::StopLifetime(const StopLifetimeRequest& req) {
  ObserveRpc("SubscriptionService.StopLifetime", [&] {
    const auto origin = ToOrigin(req.origin());

    std::lock_guard lock(*ctx_.ordering);
    ctx_.locks->StopLifetime(origin, req.local_id());
  });
}

GetSubscriptionResponse SubscriptionService::GetSubscription(const GetSubscriptionRequest& req) {
  return ObserveRpc("SubscriptionService.GetSubscription", [&] {
    const auto& key = req.key();

    auto tx           = ctx_.repository->Begin();
    auto subscription = ctx_.repository->GetSubscription(*tx, key.owner(), key.local_id());
    auto locked       = ctx_.repository->GetLockedAssets(*tx, key.owner(), key.local_id());
    tx->Rollback();

    if (!subscription) {
      throw capacity::util::NotFound("subscription " + key.owner() + "/" + std::to_string(key.local_id()) + " not found");
    }

    GetSubscriptionResponse resp;
    *resp.mutable_subscription() = ToProto(*subscription, locked ? std::optional<uint64_t>(locked->amount) : std::nullopt);
    return resp;
  });
}

ListSubscriptionsResponse SubscriptionService::ListSubscriptions(const ListSubscriptionsRequest& req) {
  return ObserveRpc("SubscriptionService.ListSubscriptions", [&] {
    ListSubscriptionsResponse resp;

    auto tx            = ctx_.repository->Begin();
    auto subscriptions = req.owner().empty() ? ctx_.repository->ListAllSubscriptions(*tx) : ctx_.repository->ListSubscriptions(*tx, req.owner());
    for (const auto& subscription : subscriptions) {
      auto locked = ctx_.repository->GetLockedAssets(*tx, subscription.owner, subscription.local_id);
      *resp.add_subscriptions() = ToProto(subscription, locked ? std::optional<uint64_t>(locked->amount) : std::nullopt);
    }
    tx->Rollback();
    return resp;
  });
}

ValidateResponse SubscriptionService::Validate(const ExemptionRequest& req) {
  return ObserveRpc("SubscriptionService.Validate", [&] {
    const auto request = FromProto(req);

    std::lock_guard  lock(*ctx_.ordering);
    const auto       verdict = ctx_.interceptor->Validate(request);
    ValidateResponse resp;
    resp.set_rejection(verdict.rejection);
    resp.set_message(verdict.message);
    return resp;
  });
}

PreDispatchResponse SubscriptionService::PreDispatch(const ExemptionRequest& req) {
  return ObserveRpc("SubscriptionService.PreDispatch", [&] {
    const auto request = FromProto(req);

    std::lock_guard     lock(*ctx_.ordering);
    const auto          result = ctx_.interceptor->PreDispatch(request);
    PreDispatchResponse resp;
    *resp.mutable_context() = ToProto(result.context);
    resp.set_rejection(result.verdict.rejection);
    return resp;
  });
}

PostDispatchResponse SubscriptionService::PostDispatch(const PostDispatchRequest& req) {
  return ObserveRpc("SubscriptionService.PostDispatch", [&] {
    const auto              context = FromProto(req.context());
    std::optional<uint64_t> actual_cost;
    if (req.has_actual_cost()) {
      actual_cost = req.actual_cost();
    }

    std::lock_guard      lock(*ctx_.ordering);
    const auto           settlement = ctx_.interceptor->PostDispatch(context, actual_cost, req.success());
    PostDispatchResponse resp;
    resp.set_debited(settlement.debited);
    resp.set_shortfall(settlement.shortfall);
    return resp;
  });
}

CallResponse SubscriptionService::Call(const ExemptionRequest& req) {
  return ObserveRpc("SubscriptionService.Call", [&] {
    const auto request = FromProto(req);

    std::lock_guard lock(*ctx_.ordering);
    const auto      result = ctx_.interceptor->Call(request, *ctx_.dispatcher);
    CallResponse    resp;
    resp.set_success(result.success);
    resp.set_actual_cost(result.actual_cost.value_or(0));
    resp.set_error(result.error);
    return resp;
  });
}

} // namespace capacity::service
