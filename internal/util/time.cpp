#include "time.hpp"

namespace capacity::util {

Timestamp SystemTimeSource::NowMillis() const {
  return ToUnixMillis(Now());
}

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t ToMillis(const google::protobuf::Duration& duration) {
  if (duration.seconds() < 0 || duration.nanos() < 0) {
    return 0;
  }
  return static_cast<uint64_t>(duration.seconds()) * 1000 + static_cast<uint64_t>(duration.nanos()) / 1000000;
}

} // namespace capacity::util
