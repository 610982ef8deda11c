#pragma once

#include "xid/core/clock.h"
#include "xid/core/id.h"
#include "xid/core/random_source.h"
#include "xid/core/time.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>

namespace xid::core {

// Concurrency selects how much of the random suffix is replaced by shared counter bits.
// More counter bits mean more IDs guaranteed distinct within one timestamp value, and
// fewer random bits.
//
//   kNano   high nibble of byte[6]       4 bits   16 values per tick
//   kLow    byte[6]                      8 bits   256 values per tick
//   kMedium byte[6..8)                  16 bits   65536 values per tick
//   kHigh   byte[6..9)                  24 bits   ~16.7M values per tick
enum class Concurrency : std::int8_t {
  kNano = 0,
  kLow = 1,
  kMedium = 2,
  kHigh = 3,
};

// parse_concurrency accepts "nano", "low", "medium", "high" (case-sensitive).
[[nodiscard]] std::optional<Concurrency> parse_concurrency(std::string_view s);
[[nodiscard]] std::string_view to_string(Concurrency level);

// SequenceCounter is the shared monotonic counter behind counter-mode generation.
// Every next() is one atomic increment-and-fetch; the value wraps on overflow and is
// never reset. Generators hold it by reference so independent generators can share
// one counter, or tests can give each generator an isolated one.
class SequenceCounter {
 public:
  explicit SequenceCounter(std::uint64_t seed) : value_(seed) {}
  ~SequenceCounter() = default;

  // Not copyable or movable (contains atomic counter)
  SequenceCounter(const SequenceCounter&) = delete;
  SequenceCounter& operator=(const SequenceCounter&) = delete;
  SequenceCounter(SequenceCounter&&) = delete;
  SequenceCounter& operator=(SequenceCounter&&) = delete;

  // Uniformly random 64-bit seed. Throws RandomSourceError.
  [[nodiscard]] static std::uint64_t random_seed(IRandomSource& random);

  std::uint64_t next() { return value_.fetch_add(1, std::memory_order_relaxed) + 1; }
  [[nodiscard]] std::uint64_t current() const { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<std::uint64_t> value_;
};

// apply_concurrency overwrites the counter-mode bits of id with the low bits of counter.
// kNano keeps the low nibble of byte[6]; the other modes replace whole bytes.
void apply_concurrency(Id& id, Concurrency level, std::uint64_t counter);

// Abstract ID generator interface for dependency injection.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Timestamp plus six random bytes.
  virtual Id next() = 0;

  // As next(), with the counter bits of level taken from the shared counter.
  virtual Id next(Concurrency level) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// IdGenerator mints IDs from an injected clock, random source and counter.
// Thread-safe as long as the injected random source is (SystemRandomSource is).
// Every method throws RandomSourceError if the random source fails; no ID is returned then.
class IdGenerator final : public IIdGenerator {
 public:
  IdGenerator(IClock& clock, IRandomSource& random, SequenceCounter& counter)
      : clock_(clock), random_(random), counter_(counter) {}
  ~IdGenerator() override = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  Id next() override;
  Id next(Concurrency level) override;

  // Mint for an explicit time instead of the clock's.
  [[nodiscard]] Id create(Timestamp ts);
  [[nodiscard]] Id create(Concurrency level, Timestamp ts);

 private:
  IClock& clock_;
  IRandomSource& random_;
  SequenceCounter& counter_;
};

// Process-wide generator over SystemClock, SystemRandomSource and one randomly seeded
// SequenceCounter, built on first use.
[[nodiscard]] IdGenerator& default_generator();

inline Id new_id() { return default_generator().next(); }
inline Id new_concurrent_id() { return default_generator().next(Concurrency::kLow); }
inline Id new_id_at(Timestamp ts) { return default_generator().create(ts); }
inline Id new_id_at(Concurrency level, Timestamp ts) {
  return default_generator().create(level, ts);
}

}  // namespace xid::core
