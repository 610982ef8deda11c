#pragma once

#include "xid/core/id.h"
#include "xid/core/result.h"

#include <string>
#include <string_view>

namespace xid::core {

// Lowercase base32 alphabet listed in ascending symbol order, so lexicographic order of the
// text form matches lexicographic order of the bytes. No padding characters.
inline constexpr std::string_view kEncoding = "0123456789abcdefghijklmnopqrstuv";

// encode_to writes exactly kEncodedLen characters to dst. The 96 payload bits fill the first
// 96 bits of the 20 five-bit symbols; the low 4 bits of the last symbol are always zero.
void encode_to(const Id& id, char* dst);

[[nodiscard]] std::string encode(const Id& id);

// is_valid reports whether text is a canonical encoding: kEncodedLen characters from
// kEncoding, with zero padding bits in the final symbol. Uppercase is not accepted.
[[nodiscard]] bool is_valid(std::string_view text);

// decode is the exact inverse of encode. Input is validated in full before any bit is
// unpacked, so a failure never yields a partially decoded value.
[[nodiscard]] Result<Id, IdError> decode(std::string_view text);

}  // namespace xid::core
