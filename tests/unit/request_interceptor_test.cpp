#include "internal/core/request_interceptor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/core/journal_dispatcher.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/delegation/proxy_grant_table.hpp"
#include "internal/events/event_log.hpp"
#include "internal/reservation/reservation_table.hpp"
#include "internal/util/errors.hpp"

namespace {

using capacity::core::ExemptionRequest;
using capacity::core::QuotaAccountant;
using capacity::core::RequestInterceptor;
using capacity::db::model::SubscriptionRecord;
using capacity::model::Origin;
using capacity::model::SubscriptionMode;
namespace v1 = capacity::manager::v1;

constexpr uint64_t kStart = 1'700'000'000'000ULL;

struct Fixture {
  std::shared_ptr<capacity::db::memory::MemoryRepository>  repository = std::make_shared<capacity::db::memory::MemoryRepository>();
  std::shared_ptr<capacity::util::ManualTimeSource>        clock      = std::make_shared<capacity::util::ManualTimeSource>(kStart);
  std::shared_ptr<QuotaAccountant>                         quota      = std::make_shared<QuotaAccountant>(QuotaAccountant::Options{});
  std::shared_ptr<capacity::delegation::ProxyGrantTable>   grants     = std::make_shared<capacity::delegation::ProxyGrantTable>();
  std::shared_ptr<capacity::reservation::ReservationTable> reservations =
      std::make_shared<capacity::reservation::ReservationTable>(clock, std::chrono::seconds(60));
  std::shared_ptr<capacity::events::EventLog> events = std::make_shared<capacity::events::EventLog>();
  RequestInterceptor                          interceptor;

  Fixture() : interceptor(repository, quota, grants, reservations, events, clock) {
  }

  // Lifetime 50_000 uTPS accrues 1_773 weight per second (35_476_000 * 50_000 / 10^9).
  void Seed(const std::string& owner, SubscriptionMode mode = SubscriptionMode::Lifetime(50'000)) {
    auto               tx = repository->Begin();
    SubscriptionRecord sub;
    sub.owner              = owner;
    sub.local_id           = repository->NextSubscriptionId(*tx, owner);
    sub.mode               = mode;
    sub.issue_time_ms      = clock->NowMillis();
    sub.last_update_ms     = clock->NowMillis();
    sub.expiration_time_ms = QuotaAccountant::ExpirationFor(mode, clock->NowMillis());
    const auto inserted = repository->InsertSubscription(*tx, sub);
    assert(inserted);
    tx->Commit();
  }

  SubscriptionRecord Load(const std::string& owner, uint32_t local_id) {
    auto tx  = repository->Begin();
    auto sub = repository->GetSubscription(*tx, owner, local_id);
    tx->Rollback();
    assert(sub);
    return *sub;
  }
};

ExemptionRequest MakeRequest(const std::string& signer, uint32_t local_id, uint64_t cost, const std::string& name = "robot.ping") {
  ExemptionRequest request;
  request.origin                   = Origin::Signed(signer);
  request.local_id                 = local_id;
  request.operation.name           = name;
  request.operation.estimated_cost = cost;
  return request;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestValidateIsReadOnly() {
  Fixture f;
  f.Seed("alice");
  f.clock->Advance(2'000);

  auto verdict = f.interceptor.Validate(MakeRequest("alice", 0, 3'547));
  assert(verdict.ok());

  verdict = f.interceptor.Validate(MakeRequest("alice", 0, 3'548));
  assert(verdict.rejection == v1::REJECTION_QUOTA_EXHAUSTED);

  // nothing was committed
  const auto sub = f.Load("alice", 0);
  assert(sub.free_weight == 0);
  assert(sub.last_update_ms == kStart);
  assert(f.reservations->Size() == 0);
}

void TestValidateRejections() {
  Fixture f;
  f.Seed("alice", SubscriptionMode::Daily(1));

  assert(f.interceptor.Validate(MakeRequest("alice", 7, 0)).rejection == v1::REJECTION_NOT_FOUND);
  assert(f.interceptor.Validate(MakeRequest("bob", 0, 0)).rejection == v1::REJECTION_NOT_FOUND);

  auto root   = MakeRequest("alice", 0, 0);
  root.origin = Origin::Root();
  assert(f.interceptor.Validate(root).rejection == v1::REJECTION_BAD_ORIGIN);

  f.clock->Advance(86'400'000);
  const auto verdict = f.interceptor.Validate(MakeRequest("alice", 0, 0));
  assert(verdict.rejection == v1::REJECTION_SUBSCRIPTION_EXPIRED);
  assert(!verdict.message.empty());
}

void TestClockRegressionIsThrown() {
  Fixture f;
  f.clock->Advance(5'000);
  f.Seed("alice");
  f.clock->Set(kStart);
  assert(Throws<capacity::util::ClockRegression>([&] { f.interceptor.Validate(MakeRequest("alice", 0, 0)); }));
}

void TestPreDispatchCommitsAccrualAndReserves() {
  Fixture f;
  f.Seed("alice");
  f.clock->Advance(2'000);

  const auto pre = f.interceptor.PreDispatch(MakeRequest("alice", 0, 1'000));
  assert(pre.verdict.ok());
  assert(pre.context.pays_no_fee);
  assert(!pre.context.reservation_id.empty());
  assert(pre.context.owner == "alice");
  assert(pre.context.local_id == 0);
  assert(pre.context.estimated_cost == 1'000);
  assert(f.reservations->Contains(pre.context.reservation_id));

  auto sub = f.Load("alice", 0);
  assert(sub.free_weight == 3'547);
  assert(sub.last_update_ms == kStart + 2'000);

  const auto settlement = f.interceptor.PostDispatch(pre.context, 800, true);
  assert(settlement.debited == 800);
  assert(settlement.shortfall == 0);
  sub = f.Load("alice", 0);
  assert(sub.free_weight == 2'747);
  assert(f.reservations->Size() == 0);

  const auto events = f.events->Drain();
  assert(events.size() == 1);
  assert(events[0].kind() == v1::EVENT_KIND_USAGE_RECORDED);
  assert(events[0].amount() == 800);
  assert(events[0].success());
}

void TestPreDispatchRejectionPaysFee() {
  Fixture f;
  f.Seed("alice");

  const auto pre = f.interceptor.PreDispatch(MakeRequest("alice", 0, 1));
  assert(pre.verdict.rejection == v1::REJECTION_QUOTA_EXHAUSTED);
  assert(!pre.context.pays_no_fee);
  assert(pre.context.reservation_id.empty());

  // settling a fee-paying context is a no-op
  const auto settlement = f.interceptor.PostDispatch(pre.context, 1, true);
  assert(settlement.debited == 0 && settlement.shortfall == 0);
  assert(f.events->Size() == 0);
}

void TestSettlementFollowsReservationNotFlag() {
  Fixture f;
  f.Seed("alice");
  f.clock->Advance(1'000);

  // clearing the flag on a reserved context does not skip the debit
  auto pre                = f.interceptor.PreDispatch(MakeRequest("alice", 0, 300));
  pre.context.pays_no_fee = false;
  const auto settlement   = f.interceptor.PostDispatch(pre.context, std::nullopt, true);
  assert(settlement.debited == 300);
  assert(f.Load("alice", 0).free_weight == 1'773 - 300);
  assert(f.reservations->Size() == 0);
}

void TestPostDispatchTwiceIsRejected() {
  Fixture f;
  f.Seed("alice");
  f.clock->Advance(1'000);

  const auto pre = f.interceptor.PreDispatch(MakeRequest("alice", 0, 100));
  f.interceptor.PostDispatch(pre.context, std::nullopt, true);
  assert(Throws<capacity::util::NotFound>([&] { f.interceptor.PostDispatch(pre.context, std::nullopt, true); }));
  assert(f.Load("alice", 0).free_weight == 1'773 - 100);
}

void TestExpiredReservationCannotSettle() {
  Fixture f;
  f.Seed("alice");
  f.clock->Advance(1'000);

  const auto pre = f.interceptor.PreDispatch(MakeRequest("alice", 0, 100));
  f.clock->Advance(60'000);
  assert(Throws<capacity::util::NotFound>([&] { f.interceptor.PostDispatch(pre.context, 100, true); }));
}

void TestShortfallDrainsAndReportsDiscrepancy() {
  Fixture f;
  f.Seed("alice");
  f.clock->Advance(1'000);

  const auto first  = f.interceptor.PreDispatch(MakeRequest("alice", 0, 1'000));
  const auto second = f.interceptor.PreDispatch(MakeRequest("alice", 0, 1'000));
  assert(first.context.pays_no_fee && second.context.pays_no_fee);
  assert(first.context.reservation_id != second.context.reservation_id);

  assert(f.interceptor.PostDispatch(first.context, 1'000, true).shortfall == 0);
  const auto settlement = f.interceptor.PostDispatch(second.context, 1'000, false);
  assert(settlement.debited == 773);
  assert(settlement.shortfall == 227);
  assert(f.Load("alice", 0).free_weight == 0);

  const auto events = f.events->Drain();
  assert(events.size() == 3);
  assert(events[1].kind() == v1::EVENT_KIND_ACCOUNTING_DISCREPANCY);
  assert(events[1].amount() == 227);
  assert(events[2].kind() == v1::EVENT_KIND_USAGE_RECORDED);
  assert(events[2].amount() == 773);
  assert(!events[2].success());
}

void TestDelegateLimitedToGrantedSubscription() {
  Fixture f;
  f.Seed("alice");
  f.Seed("alice");
  f.clock->Advance(1'000);
  f.grants->Grant("alice", "drone", 1);

  auto request  = MakeRequest("drone", 1, 10);
  request.owner = "alice";
  assert(f.interceptor.Validate(request).ok());

  request.local_id = 0;
  assert(f.interceptor.Validate(request).rejection == v1::REJECTION_BAD_ORIGIN);

  request.local_id       = 1;
  request.operation.name = "capacity.bid";
  assert(f.interceptor.Validate(request).rejection == v1::REJECTION_BAD_ORIGIN);

  auto stranger  = MakeRequest("eve", 1, 10);
  stranger.owner = "alice";
  assert(f.interceptor.Validate(stranger).rejection == v1::REJECTION_BAD_ORIGIN);

  // the delegate's settlement is charged to the owner
  request.operation.name = "robot.move";
  const auto pre         = f.interceptor.PreDispatch(request);
  assert(pre.context.signer == "drone");
  assert(pre.context.owner == "alice");
  f.interceptor.PostDispatch(pre.context, std::nullopt, true);
  assert(f.Load("alice", 1).free_weight == 1'773 - 10);
  assert(f.Load("alice", 0).free_weight == 0);
}

void TestCallDispatchesAndSettles() {
  Fixture                             f;
  capacity::core::JournalDispatcher dispatcher;
  f.Seed("alice");
  f.clock->Advance(1'000);

  auto result = f.interceptor.Call(MakeRequest("alice", 0, 500), dispatcher);
  assert(result.success);
  assert(result.actual_cost == 500u);
  assert(dispatcher.Entries().size() == 1);
  assert(dispatcher.Entries()[0].signer == "alice");
  assert(f.Load("alice", 0).free_weight == 1'773 - 500);

  dispatcher.SetActualCost("robot.ping", 200);
  result = f.interceptor.Call(MakeRequest("alice", 0, 500), dispatcher);
  assert(result.actual_cost == 200u);
  assert(f.Load("alice", 0).free_weight == 1'773 - 700);

  // a failed operation still consumes its cost
  dispatcher.SetFailure("robot.ping", "arm jammed");
  result = f.interceptor.Call(MakeRequest("alice", 0, 500), dispatcher);
  assert(!result.success);
  assert(result.error == "arm jammed");
  assert(f.Load("alice", 0).free_weight == 1'773 - 900);
}

class ThrowingDispatcher final : public capacity::core::Dispatcher {
 public:
  capacity::core::DispatchResult Dispatch(const std::string&, const capacity::model::Operation&) override {
    throw std::runtime_error("dispatcher offline");
  }
};

void TestCallSettlesWhenDispatcherThrows() {
  Fixture            f;
  ThrowingDispatcher dispatcher;
  f.Seed("alice");
  f.clock->Advance(1'000);

  assert(Throws<std::runtime_error>([&] { f.interceptor.Call(MakeRequest("alice", 0, 400), dispatcher); }));
  assert(f.reservations->Size() == 0);
  assert(f.Load("alice", 0).free_weight == 1'773 - 400);

  const auto events = f.events->Drain();
  assert(events.size() == 1);
  assert(events[0].kind() == v1::EVENT_KIND_USAGE_RECORDED);
  assert(events[0].amount() == 400);
  assert(!events[0].success());
}

void TestJournalKeepsMostRecentEntries() {
  Fixture                           f;
  capacity::core::JournalDispatcher dispatcher(2);
  f.Seed("alice");
  f.clock->Advance(1'000);

  for (uint64_t cost : {10, 20, 30}) {
    f.interceptor.Call(MakeRequest("alice", 0, cost), dispatcher);
  }
  const auto entries = dispatcher.Entries();
  assert(entries.size() == 2);
  assert(entries[0].operation.estimated_cost == 20);
  assert(entries[1].operation.estimated_cost == 30);
  assert(dispatcher.Dropped() == 1);
}

void TestCallRaisesRejections() {
  Fixture                             f;
  capacity::core::JournalDispatcher dispatcher;
  f.Seed("alice");

  assert(Throws<capacity::util::QuotaExhausted>([&] { f.interceptor.Call(MakeRequest("alice", 0, 1), dispatcher); }));
  assert(Throws<capacity::util::NotFound>([&] { f.interceptor.Call(MakeRequest("alice", 3, 0), dispatcher); }));

  auto request  = MakeRequest("drone", 0, 0);
  request.owner = "alice";
  assert(Throws<capacity::util::BadOrigin>([&] { f.interceptor.Call(request, dispatcher); }));

  assert(dispatcher.Entries().empty());
  assert(f.reservations->Size() == 0);
}

} // namespace

int main() {
  TestValidateIsReadOnly();
  TestValidateRejections();
  TestClockRegressionIsThrown();
  TestPreDispatchCommitsAccrualAndReserves();
  TestPreDispatchRejectionPaysFee();
  TestSettlementFollowsReservationNotFlag();
  TestPostDispatchTwiceIsRejected();
  TestExpiredReservationCannotSettle();
  TestShortfallDrainsAndReportsDiscrepancy();
  TestDelegateLimitedToGrantedSubscription();
  TestCallDispatchesAndSettles();
  TestCallSettlesWhenDispatcherThrows();
  TestJournalKeepsMostRecentEntries();
  TestCallRaisesRejections();

  std::cout << "capacity_manager_unit_request_interceptor: pass\n";
  return 0;
}
