#include "internal/core/request_interceptor.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/delegation/delegation_filter.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reservation/reservation_table.hpp"
#include "internal/util/errors.hpp"

namespace capacity::core {

namespace v1 = capacity::manager::v1;

namespace {

Verdict Reject(v1::Rejection rejection, std::string message) {
  return {rejection, std::move(message)};
}

std::string Key(const std::string& owner, uint32_t local_id) {
  return owner + "/" + std::to_string(local_id);
}

} // namespace

void ThrowIfRejected(const Verdict& verdict) {
  switch (verdict.rejection) {
    case v1::REJECTION_NONE:
      return;
    case v1::REJECTION_NOT_FOUND:
      throw util::NotFound(verdict.message);
    case v1::REJECTION_SUBSCRIPTION_EXPIRED:
      throw util::SubscriptionExpired(verdict.message);
    case v1::REJECTION_QUOTA_EXHAUSTED:
      throw util::QuotaExhausted(verdict.message);
    case v1::REJECTION_BAD_ORIGIN:
      throw util::BadOrigin(verdict.message);
    default:
      throw std::runtime_error("unknown rejection: " + verdict.message);
  }
}

RequestInterceptor::RequestInterceptor(std::shared_ptr<db::Repository> repository, std::shared_ptr<QuotaAccountant> quota,
                                       std::shared_ptr<delegation::DelegationFilter> delegation,
                                       std::shared_ptr<reservation::ReservationTable> reservations, std::shared_ptr<events::EventSink> events,
                                       std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)),
      quota_(std::move(quota)),
      delegation_(std::move(delegation)),
      reservations_(std::move(reservations)),
      events_(std::move(events)),
      clock_(std::move(clock)) {
}

Verdict RequestInterceptor::Check(db::Transaction& tx, const ExemptionRequest& request, util::Timestamp now,
                                  db::model::SubscriptionRecord* accrued) {
  if (request.origin.IsRoot() || request.origin.account.empty()) {
    return Reject(v1::REJECTION_BAD_ORIGIN, "fee exemption requires a signed origin");
  }

  const auto& signer = request.origin.account;
  const auto& owner  = request.owner.value_or(signer);
  const auto  key    = Key(owner, request.local_id);

  if (owner != signer) {
    if (!delegation_ || !delegation_->MayUse(signer, owner, request.local_id, request.operation)) {
      return Reject(v1::REJECTION_BAD_ORIGIN, signer + " may not charge " + key + " for " + request.operation.name);
    }
  }

  auto subscription = repository_->GetSubscription(tx, owner, request.local_id);
  if (!subscription) {
    return Reject(v1::REJECTION_NOT_FOUND, "subscription " + key + " not found");
  }

  db::model::SubscriptionRecord next;
  try {
    next = quota_->Accrue(*subscription, now);
  } catch (const util::SubscriptionExpired& e) {
    return Reject(v1::REJECTION_SUBSCRIPTION_EXPIRED, e.what());
  } catch (const util::QuotaExhausted& e) {
    return Reject(v1::REJECTION_QUOTA_EXHAUSTED, e.what());
  }

  if (request.operation.estimated_cost > next.free_weight) {
    return Reject(v1::REJECTION_QUOTA_EXHAUSTED, "subscription " + key + " holds " + std::to_string(next.free_weight) + ", operation needs " +
                                                     std::to_string(request.operation.estimated_cost));
  }

  if (accrued) *accrued = std::move(next);
  return {};
}

Verdict RequestInterceptor::Validate(const ExemptionRequest& request) {
  auto tx      = repository_->Begin();
  auto verdict = Check(*tx, request, clock_->NowMillis(), nullptr);
  tx->Rollback();
  return verdict;
}

PreDispatchResult RequestInterceptor::PreDispatch(const ExemptionRequest& request) {
  const auto now = clock_->NowMillis();

  PreDispatchResult             result;
  db::model::SubscriptionRecord accrued;

  auto tx        = repository_->Begin();
  result.verdict = Check(*tx, request, now, &accrued);
  if (!result.verdict.ok()) {
    tx->Rollback();
    CAPACITY_LOG_DEBUG("operation not fee-exempt", {observability::StringField("operation", request.operation.name),
                                                    observability::StringField("reason", result.verdict.message)});
    return result;
  }

  ThrowIfDbError(repository_->UpdateSubscription(*tx, accrued), "pre dispatch");
  tx->Commit();

  reservation::Reservation hold;
  hold.signer         = request.origin.account;
  hold.owner          = accrued.owner;
  hold.local_id       = accrued.local_id;
  hold.estimated_cost = request.operation.estimated_cost;
  hold                = reservations_->Insert(std::move(hold));

  result.context.pays_no_fee    = true;
  result.context.reservation_id = hold.id;
  result.context.signer         = hold.signer;
  result.context.owner          = hold.owner;
  result.context.local_id       = hold.local_id;
  result.context.estimated_cost = hold.estimated_cost;
  return result;
}

Settlement RequestInterceptor::PostDispatch(const ExemptionContext& context, std::optional<uint64_t> actual_cost, bool success) {
  // the reservation is authoritative; a context without one pays the fee
  if (context.reservation_id.empty()) {
    return {};
  }

  const auto hold = reservations_->Take(context.reservation_id);
  if (!hold) {
    throw util::NotFound("post dispatch: reservation " + context.reservation_id + " is unknown or already settled");
  }

  const auto now  = clock_->NowMillis();
  const auto cost = actual_cost.value_or(hold->estimated_cost);
  const auto key  = Key(hold->owner, hold->local_id);

  ExemptionContext settled = context;
  settled.signer           = hold->signer;
  settled.owner            = hold->owner;
  settled.local_id         = hold->local_id;

  Settlement settlement;

  auto tx           = repository_->Begin();
  auto subscription = repository_->GetSubscription(*tx, hold->owner, hold->local_id);
  if (subscription) {
    settlement.shortfall = quota_->DebitUpTo(*subscription, cost);
    ThrowIfDbError(repository_->UpdateSubscription(*tx, *subscription), "post dispatch");
    tx->Commit();
  } else {
    // stopped between the phases; nothing left to charge
    tx->Rollback();
    settlement.shortfall = cost;
  }
  settlement.debited = cost - settlement.shortfall;

  observability::Metrics::Instance().AddDebitedWeight(subscription ? subscription->mode.Describe() : "gone", settlement.debited);

  if (settlement.shortfall != 0) {
    observability::Metrics::Instance().RecordDiscrepancy(settlement.shortfall);

    v1::Event event;
    event.set_kind(v1::EVENT_KIND_ACCOUNTING_DISCREPANCY);
    event.set_account(hold->owner);
    event.set_local_id(hold->local_id);
    event.set_amount(settlement.shortfall);
    event.set_success(success);
    event.set_timestamp_ms(now);
    events_->Publish(event);

    CAPACITY_LOG_WARN("quota ledger could not cover dispatched cost",
                      {observability::StringField("subscription", key), observability::UintField("cost", cost),
                       observability::UintField("shortfall", settlement.shortfall)});
  }

  PublishUsage(settled, settlement.debited, success, now);
  return settlement;
}

void RequestInterceptor::PublishUsage(const ExemptionContext& context, uint64_t amount, bool success, util::Timestamp now) {
  v1::Event event;
  event.set_kind(v1::EVENT_KIND_USAGE_RECORDED);
  event.set_account(context.owner);
  event.set_local_id(context.local_id);
  event.set_amount(amount);
  event.set_success(success);
  event.set_timestamp_ms(now);
  events_->Publish(event);
}

DispatchResult RequestInterceptor::Call(const ExemptionRequest& request, Dispatcher& dispatcher) {
  observability::SpanScope span("RequestInterceptor.Call");
  span.SetAttribute("operation", request.operation.name);

  ThrowIfRejected(Validate(request));

  auto pre = PreDispatch(request);
  ThrowIfRejected(pre.verdict);

  DispatchResult result;
  try {
    result = dispatcher.Dispatch(pre.context.signer, request.operation);
  } catch (const std::exception& e) {
    // the operation may have run; charge the estimate before propagating
    span.RecordException(e.what());
    PostDispatch(pre.context, std::nullopt, false);
    throw;
  }
  if (!result.success) {
    span.RecordException(result.error);
  }

  const auto settlement = PostDispatch(pre.context, result.actual_cost, result.success);
  if (!result.actual_cost) {
    result.actual_cost = settlement.debited + settlement.shortfall;
  }
  return result;
}

} // namespace capacity::core
