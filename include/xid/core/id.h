#pragma once

#include "xid/core/result.h"
#include "xid/core/time.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

namespace xid::core {

inline constexpr std::size_t kRawLen = 12;      // binary length
inline constexpr std::size_t kEncodedLen = 20;  // text length

// Id is a 12-byte, K-ordered identifier:
//   bytes[0..6)  big-endian nanoseconds since epoch, truncated to the low 48 bits
//   bytes[6..12) random; counter-mode generation replaces a prefix with shared counter bits
//
// Regular value type (C.11): copied on assignment, ordered byte-lexicographically.
// Byte order and text order agree, so either form sorts by creation time down to
// the 48-bit timestamp. Nothing is guaranteed within one timestamp value.
struct Id {
  std::array<std::uint8_t, kRawLen> bytes{};

  auto operator<=>(const Id&) const = default;

  // The all-zero Id; its text form is twenty '0' characters.
  [[nodiscard]] static Id nil() { return Id{}; }
  [[nodiscard]] bool is_nil() const;

  // Embedded timestamp: bytes[0..6) zero-extended, nanoseconds since epoch.
  // Accepts any 12 bytes; there is no check that this library produced them.
  [[nodiscard]] std::uint64_t time() const;
  [[nodiscard]] Timestamp timestamp() const;

  // bytes[6..12) as a 48-bit big-endian unsigned integer, whatever mode produced it.
  [[nodiscard]] std::uint64_t counter() const;

  // Base32 text form (see codec.h).
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] static Result<Id, IdError> from_string(std::string_view text);
  [[nodiscard]] static Result<Id, IdError> from_bytes(std::span<const std::uint8_t> raw);
};

// Stream hooks use the text form. Extraction reads one whitespace-delimited token and sets
// failbit on invalid input, leaving the target unchanged.
std::ostream& operator<<(std::ostream& os, const Id& id);
std::istream& operator>>(std::istream& is, Id& id);

}  // namespace xid::core

namespace std {
template <>
struct hash<xid::core::Id> {
  std::size_t operator()(const xid::core::Id& id) const noexcept;
};
}  // namespace std
