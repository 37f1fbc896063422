#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "internal/events/event_sink.hpp"

namespace capacity::events {

// Buffers published events in order until drained. When `capacity` is
// non-zero the oldest events are dropped first.
class EventLog final : public EventSink {
 public:
  explicit EventLog(std::size_t capacity = 0);

  void Publish(const capacity::manager::v1::Event& event) override;

  std::vector<capacity::manager::v1::Event> Drain();
  std::vector<capacity::manager::v1::Event> Snapshot() const;

  std::size_t Size() const;
  std::size_t Dropped() const;

 private:
  const std::size_t                        capacity_;
  mutable std::mutex                       mutex_;
  std::deque<capacity::manager::v1::Event> events_;
  std::size_t                              dropped_ = 0;
};

} // namespace capacity::events
