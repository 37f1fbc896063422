#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/dispatcher.hpp"

namespace capacity::core {

/*
  Dispatcher that executes nothing and records what it was asked to run.
  Used by the standalone daemon and by tests; per-operation costs and
  failures can be scripted by name. When `capacity` is non-zero only the
  most recent entries are kept.
*/
class JournalDispatcher final : public Dispatcher {
 public:
  struct Entry {
    std::string      signer;
    model::Operation operation;
  };

  explicit JournalDispatcher(std::size_t capacity = 0);

  DispatchResult Dispatch(const std::string& signer, const model::Operation& operation) override;

  void SetActualCost(const std::string& name, uint64_t cost);
  void SetFailure(const std::string& name, std::string error);

  std::vector<Entry> Entries() const;
  std::size_t        Dropped() const;

 private:
  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, uint64_t>    costs_;
  std::unordered_map<std::string, std::string> failures_;
  const std::size_t                            capacity_;
  std::deque<Entry>                            entries_;
  std::size_t                                  dropped_ = 0;
};

} // namespace capacity::core
