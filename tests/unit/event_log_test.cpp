#include "internal/events/event_log.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/events/logging_event_sink.hpp"

namespace {

using capacity::events::EventLog;
using capacity::events::LoggingEventSink;
namespace v1 = capacity::manager::v1;

v1::Event MakeEvent(v1::EventKind kind, uint64_t amount) {
  v1::Event event;
  event.set_kind(kind);
  event.set_account("alice");
  event.set_amount(amount);
  return event;
}

void TestDrainPreservesOrder() {
  EventLog log;
  log.Publish(MakeEvent(v1::EVENT_KIND_AUCTION_STARTED, 1));
  log.Publish(MakeEvent(v1::EVENT_KIND_NEW_BID, 2));
  log.Publish(MakeEvent(v1::EVENT_KIND_AUCTION_FINISHED, 3));

  assert(log.Snapshot().size() == 3);
  const auto events = log.Drain();
  assert(events.size() == 3);
  assert(events[0].kind() == v1::EVENT_KIND_AUCTION_STARTED);
  assert(events[1].kind() == v1::EVENT_KIND_NEW_BID);
  assert(events[2].amount() == 3);
  assert(log.Size() == 0);
  assert(log.Drain().empty());
}

void TestCapacityDropsOldest() {
  EventLog log(2);
  for (uint64_t i = 1; i <= 5; ++i) {
    log.Publish(MakeEvent(v1::EVENT_KIND_USAGE_RECORDED, i));
  }
  assert(log.Size() == 2);
  assert(log.Dropped() == 3);

  const auto events = log.Drain();
  assert(events[0].amount() == 4);
  assert(events[1].amount() == 5);
}

void TestLoggingSinkForwards() {
  auto             log = std::make_shared<EventLog>();
  LoggingEventSink sink(log);

  sink.Publish(MakeEvent(v1::EVENT_KIND_ACCOUNTING_DISCREPANCY, 7));
  sink.Publish(MakeEvent(v1::EVENT_KIND_SUBSCRIPTION_ACTIVATED, 0));
  assert(log->Size() == 2);
  assert(log->Snapshot()[0].kind() == v1::EVENT_KIND_ACCOUNTING_DISCREPANCY);

  LoggingEventSink terminal(nullptr);
  terminal.Publish(MakeEvent(v1::EVENT_KIND_NEW_BID, 1));
}

} // namespace

int main() {
  TestDrainPreservesOrder();
  TestCapacityDropsOldest();
  TestLoggingSinkForwards();

  std::cout << "capacity_manager_unit_event_log: pass\n";
  return 0;
}
