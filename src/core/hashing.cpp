#include "xid/core/hashing.h"

namespace xid::core {

std::uint64_t stable_hash64(const std::span<const std::uint8_t> input) noexcept {
  constexpr std::uint64_t kOffset = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffset;
  for (const std::uint8_t byte : input) {
    hash ^= static_cast<std::uint64_t>(byte);
    hash *= kPrime;
  }
  return hash;
}

}  // namespace xid::core
