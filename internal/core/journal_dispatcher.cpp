#include "internal/core/journal_dispatcher.hpp"

namespace capacity::core {

JournalDispatcher::JournalDispatcher(std::size_t capacity) : capacity_(capacity) {
}

DispatchResult JournalDispatcher::Dispatch(const std::string& signer, const model::Operation& operation) {
  std::lock_guard lock(mutex_);
  if (capacity_ != 0 && entries_.size() >= capacity_) {
    entries_.pop_front();
    ++dropped_;
  }
  entries_.push_back({signer, operation});

  DispatchResult result;
  if (auto it = costs_.find(operation.name); it != costs_.end()) {
    result.actual_cost = it->second;
  }
  if (auto it = failures_.find(operation.name); it != failures_.end()) {
    result.success = false;
    result.error   = it->second;
  }
  return result;
}

void JournalDispatcher::SetActualCost(const std::string& name, uint64_t cost) {
  std::lock_guard lock(mutex_);
  costs_[name] = cost;
}

void JournalDispatcher::SetFailure(const std::string& name, std::string error) {
  std::lock_guard lock(mutex_);
  failures_[name] = std::move(error);
}

std::vector<JournalDispatcher::Entry> JournalDispatcher::Entries() const {
  std::lock_guard lock(mutex_);
  return {entries_.begin(), entries_.end()};
}

std::size_t JournalDispatcher::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace capacity::core
