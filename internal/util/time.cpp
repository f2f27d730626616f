#include "time.hpp"

namespace recall::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  if (ms == 0) return {};
  return ToProto(FromUnixMillis(ms));
}

uint64_t ProtoToMillis(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() <= 0 && ts.nanos() <= 0) return 0;
  return ToUnixMillis(FromProto(ts));
}

double DaysBetween(uint64_t from_ms, uint64_t to_ms) {
  if (to_ms <= from_ms) return 0.0;
  return static_cast<double>(to_ms - from_ms) / static_cast<double>(kMillisPerDay);
}

} // namespace recall::util
