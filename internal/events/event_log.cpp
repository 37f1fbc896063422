#include "event_log.hpp"

#include <iterator>

namespace capacity::events {

EventLog::EventLog(std::size_t capacity) : capacity_(capacity) {
}

void EventLog::Publish(const capacity::manager::v1::Event& event) {
  std::lock_guard lock(mutex_);
  if (capacity_ != 0 && events_.size() >= capacity_) {
    events_.pop_front();
    ++dropped_;
  }
  events_.push_back(event);
}

std::vector<capacity::manager::v1::Event> EventLog::Drain() {
  std::lock_guard                           lock(mutex_);
  std::vector<capacity::manager::v1::Event> out(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
  events_.clear();
  return out;
}

std::vector<capacity::manager::v1::Event> EventLog::Snapshot() const {
  std::lock_guard lock(mutex_);
  return {events_.begin(), events_.end()};
}

std::size_t EventLog::Size() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

std::size_t EventLog::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace capacity::events
