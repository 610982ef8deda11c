#include "xid/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace xid::core {

std::string format_iso8601(const Timestamp ts) {
  const auto since_epoch = ts.time_since_epoch();
  auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);

  const std::time_t time_t_secs = static_cast<std::time_t>(secs.count());
  std::tm utc{};
  gmtime_r(&time_t_secs, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(9)
      << nanos.count() << 'Z';
  return oss.str();
}

Timestamp SystemClock::now() {
  return now_utc();
}

Timestamp FixedClock::now() {
  return fixed_time_;
}

}  // namespace xid::core
