#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace recall::util {

/*
  Time utilities. Single place to control the clock source.

  Persistent rows carry Unix milliseconds; 0 means "unset".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr uint64_t kMillisPerDay = 24ull * 60 * 60 * 1000;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Unix millis <-> Timestamp; an unset value maps to an empty message and back.
google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

double DaysBetween(uint64_t from_ms, uint64_t to_ms);

} // namespace recall::util
