#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace capacity::core {

// Repository results surface to callers as the shared error types.
inline void ThrowIfDbError(const capacity::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + std::string(capacity::db::ToString(result.code));
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }
  switch (result.code) {
    case capacity::db::ErrorCode::AlreadyExists:
      throw capacity::util::AlreadyExists(message);
    case capacity::db::ErrorCode::NotFound:
      throw capacity::util::NotFound(message);
    case capacity::db::ErrorCode::Conflict:
    case capacity::db::ErrorCode::SerializationFailure:
      throw capacity::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace capacity::core
