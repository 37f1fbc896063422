#pragma once

#include <cstdint>
#include <string>

#include "internal/model/operation.hpp"

namespace capacity::delegation {

/*
  Capability check consulted when the signer of an operation is not the
  owner of the subscription it wants to charge.
*/
class DelegationFilter {
 public:
  virtual ~DelegationFilter() = default;

  virtual bool MayUse(const std::string& delegate, const std::string& owner, uint32_t local_id, const model::Operation& operation) const = 0;
};

} // namespace capacity::delegation
