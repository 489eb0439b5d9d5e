#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace tracelens::util {

/*
  Time utilities: the single place that controls the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Span timestamps are carried as fractional milliseconds since the epoch.
double                      ToEpochMillis(const google::protobuf::Timestamp& ts);
google::protobuf::Timestamp FromEpochMillis(double millis);

} // namespace tracelens::util
