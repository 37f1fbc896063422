#include "logging_event_sink.hpp"

#include "internal/observability/logging.hpp"

namespace capacity::events {

using capacity::manager::v1::EventKind_Name;
using capacity::manager::v1::EVENT_KIND_ACCOUNTING_DISCREPANCY;

LoggingEventSink::LoggingEventSink(std::shared_ptr<EventSink> next) : next_(std::move(next)) {
}

void LoggingEventSink::Publish(const capacity::manager::v1::Event& event) {
  if (event.kind() == EVENT_KIND_ACCOUNTING_DISCREPANCY) {
    CAPACITY_LOG_WARN("event", {observability::StringField("kind", EventKind_Name(event.kind())), observability::StringField("account", event.account()),
                                observability::UintField("local_id", event.local_id()), observability::UintField("shortfall", event.amount())});
  } else {
    CAPACITY_LOG_INFO("event", {observability::StringField("kind", EventKind_Name(event.kind())), observability::StringField("account", event.account()),
                                observability::UintField("auction_id", event.auction_id()), observability::UintField("local_id", event.local_id()),
                                observability::UintField("amount", event.amount())});
  }

  if (next_) {
    next_->Publish(event);
  }
}

} // namespace capacity::events
