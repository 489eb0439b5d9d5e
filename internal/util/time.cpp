#include "time.hpp"

#include <cmath>

namespace tracelens::util {

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

double ToEpochMillis(const google::protobuf::Timestamp& ts) {
  return static_cast<double>(ts.seconds()) * 1000.0 + static_cast<double>(ts.nanos()) / 1'000'000.0;
}

google::protobuf::Timestamp FromEpochMillis(double millis) {
  auto seconds = static_cast<int64_t>(std::floor(millis / 1000.0));
  auto nanos   = static_cast<int64_t>(std::llround((millis - static_cast<double>(seconds) * 1000.0) * 1'000'000.0));
  if (nanos >= 1'000'000'000) {
    seconds += 1;
    nanos -= 1'000'000'000;
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(seconds);
  ts.set_nanos(static_cast<int32_t>(nanos));
  return ts;
}

} // namespace tracelens::util
