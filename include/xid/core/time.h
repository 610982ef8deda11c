#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace xid::core {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::nanoseconds>;

inline Timestamp now_utc() { return std::chrono::time_point_cast<std::chrono::nanoseconds>(Clock::now()); }

// Nanoseconds since the Unix epoch, reinterpreted as unsigned (pre-epoch times wrap).
inline std::uint64_t to_unix_nanos(const Timestamp ts) {
  return static_cast<std::uint64_t>(ts.time_since_epoch().count());
}

inline Timestamp from_unix_nanos(const std::uint64_t nanos) {
  return Timestamp(std::chrono::nanoseconds(static_cast<std::int64_t>(nanos)));
}

// Format as ISO 8601 UTC with nanosecond fraction, e.g. 2026-01-01T00:00:00.000000001Z.
[[nodiscard]] std::string format_iso8601(Timestamp ts);

}  // namespace xid::core
