#pragma once

#include <stdexcept>
#include <string>

namespace capacity::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller lacks the privilege or ownership the entry point requires.
class BadOrigin : public std::runtime_error {
 public:
  explicit BadOrigin(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BiddingClosed : public std::runtime_error {
 public:
  explicit BiddingClosed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BidTooLow : public std::runtime_error {
 public:
  explicit BidTooLow(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyClaimed : public std::runtime_error {
 public:
  explicit AlreadyClaimed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SubscriptionExpired : public std::runtime_error {
 public:
  explicit SubscriptionExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QuotaExhausted : public std::runtime_error {
 public:
  explicit QuotaExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidAmount : public std::runtime_error {
 public:
  explicit InvalidAmount(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotLockBacked : public std::runtime_error {
 public:
  explicit NotLockBacked(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  The time source went backwards. Never recoverable: the caller must treat the
  host clock as broken.
*/
class ClockRegression : public std::runtime_error {
 public:
  explicit ClockRegression(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by the currency collaborator (insufficient free or reserved balance).
class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace capacity::util
