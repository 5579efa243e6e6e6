#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace berth::util {

/*
  Time utilities; the one place that reads the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

/*
  Parses an events since/until value relative to `now`.

  Accepts unix seconds ("1700000000", "1700000000.5"), RFC 3339
  ("2024-01-02T03:04:05Z") and relative durations ("90s", "10m", "1h30m").
*/
TimePoint ParseTimeFilter(const std::string& value, TimePoint now);

} // namespace berth::util
