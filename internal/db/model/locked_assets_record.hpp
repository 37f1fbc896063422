#pragma once

#include <cstdint>
#include <string>

namespace capacity::db::model {

// Deposit backing a lock-path subscription. Its presence marks the
// subscription as refundable; auction-path subscriptions never have one.
struct LockedAssetsRecord {
  std::string owner;
  uint32_t    local_id = 0;
  uint64_t    amount   = 0;
};

} // namespace capacity::db::model
