#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace berth::util {

namespace {

// Half the clock's span, so that `now - ago` stays representable too.
double MaxFilterSeconds() {
  return std::chrono::duration<double>(Clock::duration::max()).count() / 2;
}

bool InRange(double seconds) {
  return std::isfinite(seconds) && seconds >= 0 && seconds <= MaxFilterSeconds();
}

bool IsNumeric(const std::string& value) {
  bool seen_digit = false;
  bool seen_dot   = false;
  for (char c : value) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      seen_digit = true;
    } else if (c == '.' && !seen_dot) {
      seen_dot = true;
    } else {
      return false;
    }
  }
  return seen_digit;
}

/*
  Returns false for syntax errors; throws for values the clock cannot hold.
*/
bool ParseDuration(const std::string& value, std::chrono::nanoseconds* out) {
  double total_seconds = 0;
  size_t i             = 0;
  if (value.empty()) {
    return false;
  }

  while (i < value.size()) {
    const size_t start = i;
    while (i < value.size() && (std::isdigit(static_cast<unsigned char>(value[i])) || value[i] == '.')) {
      ++i;
    }
    if (start == i) {
      return false;
    }
    const double amount = std::strtod(value.substr(start, i - start).c_str(), nullptr);

    const size_t unit_start = i;
    while (i < value.size() && std::isalpha(static_cast<unsigned char>(value[i]))) {
      ++i;
    }
    const auto unit = value.substr(unit_start, i - unit_start);

    double scale = 0;
    if (unit == "h") {
      scale = 3600;
    } else if (unit == "m") {
      scale = 60;
    } else if (unit == "s") {
      scale = 1;
    } else if (unit == "ms") {
      scale = 1e-3;
    } else {
      return false;
    }
    total_seconds += amount * scale;
    if (!InRange(total_seconds)) {
      throw Internal("invalid time value '" + value + "': out of range");
    }
  }

  *out = std::chrono::nanoseconds(std::llround(total_seconds * 1e9));
  return true;
}

} // namespace

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

TimePoint ParseTimeFilter(const std::string& value, TimePoint now) {
  if (IsNumeric(value)) {
    const double seconds = std::strtod(value.c_str(), nullptr);
    if (!InRange(seconds)) {
      throw Internal("invalid time value '" + value + "': out of range");
    }
    return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
  }

  google::protobuf::Timestamp ts;
  if (google::protobuf::util::TimeUtil::FromString(value, &ts)) {
    if (std::abs(static_cast<double>(ts.seconds())) > MaxFilterSeconds()) {
      throw Internal("invalid time value '" + value + "': out of range");
    }
    return FromProto(ts);
  }

  std::chrono::nanoseconds ago{0};
  if (ParseDuration(value, &ago)) {
    return now - std::chrono::duration_cast<Clock::duration>(ago);
  }

  throw Internal("invalid time value '" + value + "'");
}

} // namespace berth::util
