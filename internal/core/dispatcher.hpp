#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/operation.hpp"

namespace capacity::core {

struct DispatchResult {
  bool success = true;

  // Measured cost; when unset the operation's estimate is charged.
  std::optional<uint64_t> actual_cost;

  std::string error;
};

/*
  Downstream executor for operations admitted by the RequestInterceptor.
  Its effects are final once it returns; nothing here rolls them back.
*/
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual DispatchResult Dispatch(const std::string& signer, const model::Operation& operation) = 0;
};

} // namespace capacity::core
