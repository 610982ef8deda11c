#pragma once

#include "xid/core/time.h"

#include <string>

namespace xid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current time with nanosecond resolution.
  virtual Timestamp now() = 0;

  // Return now() in ISO 8601 format (UTC).
  [[nodiscard]] std::string now_iso8601() { return format_iso8601(now()); }

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// Fixed clock: returns a constant timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Timestamp fixed_time) : fixed_time_(fixed_time) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  Timestamp now() override;

  void set(Timestamp fixed_time) { fixed_time_ = fixed_time; }

 private:
  Timestamp fixed_time_;
};

}  // namespace xid::core
