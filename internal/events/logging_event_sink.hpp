#pragma once

#include <memory>

#include "internal/events/event_sink.hpp"

namespace capacity::events {

// Writes one structured log line per event, then forwards it.
class LoggingEventSink final : public EventSink {
 public:
  explicit LoggingEventSink(std::shared_ptr<EventSink> next);

  void Publish(const capacity::manager::v1::Event& event) override;

 private:
  std::shared_ptr<EventSink> next_;
};

} // namespace capacity::events
