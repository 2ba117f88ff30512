#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace artscan::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t ms);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace artscan::util
