#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace capacity::reservation {

/*
  Pre-dispatch hold on a subscription.

  Issued when an operation is admitted as fee-exempt and consumed exactly
  once by post-dispatch settlement.
*/
struct Reservation {
  std::string id;

  std::string signer;
  std::string owner;
  uint32_t    local_id = 0;

  uint64_t estimated_cost = 0;

  util::Timestamp expires_at_ms = 0;
};

} // namespace capacity::reservation
