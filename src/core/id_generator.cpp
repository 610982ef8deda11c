#include "xid/core/id_generator.h"

#include <array>

namespace xid::core {

namespace {

constexpr std::uint64_t kTimestampMask = 0xFFFF'FFFF'FFFFull;  // low 48 bits

struct DefaultGeneratorState {
  SystemClock clock;
  SystemRandomSource random;
  SequenceCounter counter{SequenceCounter::random_seed(random)};
  IdGenerator generator{clock, random, counter};
};

}  // namespace

std::optional<Concurrency> parse_concurrency(const std::string_view s) {
  if (s == "nano") {
    return Concurrency::kNano;
  }
  if (s == "low") {
    return Concurrency::kLow;
  }
  if (s == "medium") {
    return Concurrency::kMedium;
  }
  if (s == "high") {
    return Concurrency::kHigh;
  }
  return std::nullopt;
}

std::string_view to_string(const Concurrency level) {
  switch (level) {
    case Concurrency::kNano:
      return "nano";
    case Concurrency::kLow:
      return "low";
    case Concurrency::kMedium:
      return "medium";
    case Concurrency::kHigh:
      return "high";
  }
  return "unknown";  // unreachable
}

std::uint64_t SequenceCounter::random_seed(IRandomSource& random) {
  std::array<std::uint8_t, 8> raw{};
  random.fill(raw);

  std::uint64_t seed = 0;
  for (const auto byte : raw) {
    seed = (seed << 8) | byte;
  }
  return seed;
}

void apply_concurrency(Id& id, const Concurrency level, const std::uint64_t counter) {
  auto& b = id.bytes;
  switch (level) {
    case Concurrency::kNano:
      b[6] = static_cast<std::uint8_t>(((counter << 4) & 0xF0) | (b[6] & 0x0F));
      break;
    case Concurrency::kLow:
      b[6] = static_cast<std::uint8_t>(counter);
      break;
    case Concurrency::kMedium:
      b[6] = static_cast<std::uint8_t>(counter >> 8);
      b[7] = static_cast<std::uint8_t>(counter);
      break;
    case Concurrency::kHigh:
      b[6] = static_cast<std::uint8_t>(counter >> 16);
      b[7] = static_cast<std::uint8_t>(counter >> 8);
      b[8] = static_cast<std::uint8_t>(counter);
      break;
  }
}

Id IdGenerator::next() {
  return create(clock_.now());
}

Id IdGenerator::next(const Concurrency level) {
  return create(level, clock_.now());
}

Id IdGenerator::create(const Timestamp ts) {
  Id id;

  // Timestamp, 6 bytes, big endian
  const std::uint64_t nanos = to_unix_nanos(ts) & kTimestampMask;
  for (std::size_t i = 0; i < 6; ++i) {
    id.bytes[i] = static_cast<std::uint8_t>(nanos >> (8 * (5 - i)));
  }

  // Random, 6 bytes
  random_.fill(std::span<std::uint8_t>(id.bytes).subspan(6));
  return id;
}

Id IdGenerator::create(const Concurrency level, const Timestamp ts) {
  Id id = create(ts);
  apply_concurrency(id, level, counter_.next());
  return id;
}

IdGenerator& default_generator() {
  static DefaultGeneratorState state;
  return state.generator;
}

}  // namespace xid::core
