#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace chartsync::util {

/*
  Clock and timestamp conversions. Storage keeps unix milliseconds, the wire uses protobuf Timestamp.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Millisecond helpers for the storage layer, which keeps timestamps as integers.
uint64_t                    ToUnixMillis(const google::protobuf::Timestamp& ts);
google::protobuf::Timestamp MillisToProto(uint64_t ms);

} // namespace chartsync::util
