#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace capacity::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace capacity::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const BadOrigin*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const BiddingClosed*>(&e) || dynamic_cast<const AlreadyClaimed*>(&e) ||
      dynamic_cast<const SubscriptionExpired*>(&e) || dynamic_cast<const NotLockBacked*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const BidTooLow*>(&e) || dynamic_cast<const InvalidAmount*>(&e) || dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const QuotaExhausted*>(&e) || dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }

  // ClockRegression lands here: the host clock is broken
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace capacity::grpc
