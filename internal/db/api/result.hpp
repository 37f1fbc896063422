#pragma once

#include <string>
#include <string_view>

namespace capacity::db {

/*
  Portable DB result codes.

  Backends translate driver errors into these; nothing above the repository
  sees a pqxx or sqlite error type.
*/

enum class ErrorCode {
  OK = 0,

  // row addressed by an update or delete does not exist
  NotFound,
  // primary key already taken (auction id, owner/local_id)
  AlreadyExists,

  Conflict,
  Busy,
  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
    default:
      return "internal error";
  }
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace capacity::db
