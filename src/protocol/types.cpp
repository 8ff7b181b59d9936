#include "tscache/types.hpp"

#include <cstdio>

namespace tscache {

LogicalTimestamp LogicalTimestamp::now() { return from_time_point(Clock::now()); }

LogicalTimestamp LogicalTimestamp::from_time_point(TimePoint tp) {
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      tp.time_since_epoch())
                      .count();
  LogicalTimestamp ts;
  ts.seconds = ns / 1000000000LL;
  ts.nanoseconds = static_cast<std::int32_t>(ns % 1000000000LL);
  if (ts.nanoseconds < 0) {
    ts.nanoseconds += 1000000000;
    --ts.seconds;
  }
  return ts;
}

std::string LogicalTimestamp::to_string() const {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%lld.%09d", static_cast<long long>(seconds),
                static_cast<int>(nanoseconds));
  return buf;
}

Ordering compare(const LogicalTimestamp &a, const LogicalTimestamp &b) {
  if (a < b)
    return Ordering::Less;
  if (b < a)
    return Ordering::Greater;
  return Ordering::Equal;
}

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "NONE";
  case ErrorKind::Unavailable:
    return "UNAVAILABLE";
  case ErrorKind::Corrupt:
    return "CORRUPT";
  case ErrorKind::Serialization:
    return "SERIALIZATION";
  }
  return "UNKNOWN";
}

const char *outcome_name(WriteOutcome outcome) {
  return outcome == WriteOutcome::Accepted ? "accepted" : "rejected";
}

} // namespace tscache
