#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/subscription_mode.hpp"

namespace capacity::db::model {

/*
  Persistent subscription ledger, keyed by (owner, local_id).

  IMPORTANT:
  - free_weight only grows through accrual and only shrinks through debit.
  - last_update never exceeds the clock that last touched the row.
  - expiration_time_ms is fixed at issuance (Daily only).
*/

struct SubscriptionRecord {
  std::string owner;
  uint32_t    local_id = 0;

  uint64_t free_weight = 0;

  capacity::model::SubscriptionMode mode;

  uint64_t issue_time_ms  = 0;
  uint64_t last_update_ms = 0;

  std::optional<uint64_t> expiration_time_ms;
};

} // namespace capacity::db::model
