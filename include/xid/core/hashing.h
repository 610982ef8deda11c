#pragma once

#include <cstdint>
#include <span>

namespace xid::core {

// FNV-1a 64-bit over raw bytes. Stable across runs and platforms; not cryptographic.
[[nodiscard]] std::uint64_t stable_hash64(std::span<const std::uint8_t> input) noexcept;

}  // namespace xid::core
