#include "time.hpp"

namespace artscan::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  return ToProto(TimePoint{std::chrono::milliseconds(ms)});
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace artscan::util
