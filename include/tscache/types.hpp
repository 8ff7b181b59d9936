#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tscache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Bytes = std::vector<std::uint8_t>;

enum class Ordering { Less, Equal, Greater };

// Caller-supplied write time. Writers on different hosts are assumed to have
// clocks close enough for the cache's purpose; nothing here corrects skew.
struct LogicalTimestamp {
  std::int64_t seconds{0};
  std::int32_t nanoseconds{0};

  static LogicalTimestamp now();
  static LogicalTimestamp from_time_point(TimePoint tp);

  bool is_zero() const { return seconds == 0 && nanoseconds == 0; }
  std::string to_string() const;

  friend bool operator==(const LogicalTimestamp &, const LogicalTimestamp &) = default;
  friend auto operator<=>(const LogicalTimestamp &a, const LogicalTimestamp &b) {
    if (a.seconds != b.seconds)
      return a.seconds <=> b.seconds;
    return a.nanoseconds <=> b.nanoseconds;
  }
};

Ordering compare(const LogicalTimestamp &a, const LogicalTimestamp &b);

struct CacheRecord {
  std::optional<Bytes> value;
  LogicalTimestamp write_ts{};
  LogicalTimestamp invalidate_ts{};

  bool fresh() const { return write_ts >= invalidate_ts; }
  bool visible() const { return value.has_value() && fresh(); }
};

enum class WriteOutcome { Accepted, Rejected };

struct Lookup {
  bool hit{false};
  Bytes value;
};

enum class ErrorKind { None, Unavailable, Corrupt, Serialization };

struct StoreError {
  ErrorKind kind{ErrorKind::None};
  std::string message;
};

const char *error_kind_name(ErrorKind kind);
const char *outcome_name(WriteOutcome outcome);

inline void set_error(StoreError *err, ErrorKind kind, std::string message) {
  if (err) {
    err->kind = kind;
    err->message = std::move(message);
  }
}

inline Bytes to_bytes(const std::string &s) { return Bytes(s.begin(), s.end()); }
inline std::string to_string(const Bytes &b) {
  return std::string(b.begin(), b.end());
}

} // namespace tscache
