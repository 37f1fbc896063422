#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace capacity::util {

/*
  Time utilities; the single place that controls the clock source.

  Timestamps are unix milliseconds as delivered by the host ledger.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Timestamp = std::uint64_t;

constexpr Timestamp kMillisPerDay = 24ULL * 60 * 60 * 1000;

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual Timestamp NowMillis() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  Timestamp NowMillis() const override;
};

// Host-driven clock; also what the tests step by hand.
class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(Timestamp start = 0) : now_(start) {
  }

  Timestamp NowMillis() const override {
    return now_.load();
  }

  void Set(Timestamp now) {
    now_.store(now);
  }

  void Advance(Timestamp delta_ms) {
    now_.fetch_add(delta_ms);
  }

 private:
  std::atomic<Timestamp> now_;
};

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

uint64_t ToMillis(const google::protobuf::Duration& duration);

} // namespace capacity::util
