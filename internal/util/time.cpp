#include "time.hpp"

namespace profile::util {

TimePoint Now() {
  return Clock::now();
}

int64_t NowMillis() {
  return ToUnixMillis(Now());
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t millis) {
  return TimePoint{} + std::chrono::milliseconds(millis);
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(duration.seconds()) +
                                                               std::chrono::nanoseconds(duration.nanos()));
}

std::chrono::milliseconds FromProtoOr(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback) {
  const auto value = FromProto(duration);
  return value.count() > 0 ? value : fallback;
}

} // namespace profile::util
