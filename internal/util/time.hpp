#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace profile::util {

/*
  Clock and conversion helpers.

  Persisted timestamps (created, last_seen, session stamps, version ids) are
  unix milliseconds on the system clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
int64_t   NowMillis();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t millis);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration);

// Falls back to `fallback` when the duration is unset or zero.
std::chrono::milliseconds FromProtoOr(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback);

} // namespace profile::util
