#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "capacity/manager/v1.hpp"
#include "internal/core/dispatcher.hpp"
#include "internal/core/quota_accountant.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/operation.hpp"
#include "internal/model/origin.hpp"
#include "internal/util/time.hpp"

namespace capacity::delegation {
class DelegationFilter;
}
namespace capacity::events {
class EventSink;
}
namespace capacity::reservation {
class ReservationTable;
}

namespace capacity::core {

// Charge selection for one operation. Without `owner` the signer charges its
// own subscription; with it the signer acts as a delegate of `owner`.
struct ExemptionRequest {
  model::Origin              origin;
  std::optional<std::string> owner;
  uint32_t                   local_id = 0;
  model::Operation           operation;
};

struct Verdict {
  capacity::manager::v1::Rejection rejection = capacity::manager::v1::REJECTION_NONE;
  std::string                      message;

  bool ok() const {
    return rejection == capacity::manager::v1::REJECTION_NONE;
  }
};

// Handed from PreDispatch to PostDispatch.
struct ExemptionContext {
  bool        pays_no_fee = false;
  std::string reservation_id;
  std::string signer;
  std::string owner;
  uint32_t    local_id       = 0;
  uint64_t    estimated_cost = 0;
};

struct PreDispatchResult {
  ExemptionContext context;
  Verdict          verdict;
};

struct Settlement {
  uint64_t debited   = 0;
  uint64_t shortfall = 0;
};

/*
  RequestInterceptor

  Three-phase fee exemption around a downstream operation:

    Validate      trial accrual, nothing is written
    PreDispatch   commits the accrual and reserves the exemption
    PostDispatch  debits the actual cost and releases the reservation

  Validation failures are verdicts, not errors: the operation may still run
  paying the normal fee. ClockRegression is always thrown.

  Settlement never undoes the downstream effects. A ledger that cannot cover
  the cost is drained to zero and an ACCOUNTING_DISCREPANCY event reports the
  shortfall.
*/
class RequestInterceptor {
 public:
  RequestInterceptor(std::shared_ptr<db::Repository> repository, std::shared_ptr<QuotaAccountant> quota,
                     std::shared_ptr<delegation::DelegationFilter> delegation, std::shared_ptr<reservation::ReservationTable> reservations,
                     std::shared_ptr<events::EventSink> events, std::shared_ptr<const util::TimeSource> clock);

  Verdict Validate(const ExemptionRequest& request);

  PreDispatchResult PreDispatch(const ExemptionRequest& request);

  // Settles the reservation named by the context; `pays_no_fee` is not
  // consulted. A context with no reservation id is a no-op. Throws NotFound
  // when the reservation is unknown, expired or settled.
  Settlement PostDispatch(const ExemptionContext& context, std::optional<uint64_t> actual_cost, bool success);

  // Explicit path: rejections are thrown as the matching error. A dispatcher
  // that throws is settled as a failure at the estimated cost, then rethrown.
  DispatchResult Call(const ExemptionRequest& request, Dispatcher& dispatcher);

 private:
  // Validation against `tx`; fills `accrued` when the verdict is ok.
  Verdict Check(db::Transaction& tx, const ExemptionRequest& request, util::Timestamp now, db::model::SubscriptionRecord* accrued);

  void PublishUsage(const ExemptionContext& context, uint64_t amount, bool success, util::Timestamp now);

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<QuotaAccountant>               quota_;
  std::shared_ptr<delegation::DelegationFilter>  delegation_;
  std::shared_ptr<reservation::ReservationTable> reservations_;
  std::shared_ptr<events::EventSink>             events_;
  std::shared_ptr<const util::TimeSource>        clock_;
};

// Throws the error matching a rejected verdict; no-op for ok.
void ThrowIfRejected(const Verdict& verdict);

} // namespace capacity::core
