#include "xid/core/id.h"

#include "xid/core/codec.h"
#include "xid/core/hashing.h"

#include <algorithm>
#include <istream>
#include <ostream>

namespace xid::core {

namespace {

std::uint64_t read_uint48(const std::uint8_t* p) {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < 6; ++i) {
    value = (value << 8) | p[i];
  }
  return value;
}

}  // namespace

bool Id::is_nil() const {
  return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; });
}

std::uint64_t Id::time() const {
  return read_uint48(bytes.data());
}

Timestamp Id::timestamp() const {
  return from_unix_nanos(time());
}

std::uint64_t Id::counter() const {
  return read_uint48(bytes.data() + 6);
}

std::string Id::to_string() const {
  return encode(*this);
}

Result<Id, IdError> Id::from_string(const std::string_view text) {
  return decode(text);
}

Result<Id, IdError> Id::from_bytes(const std::span<const std::uint8_t> raw) {
  if (raw.size() != kRawLen) {
    return Result<Id, IdError>::err(IdError::kInvalidId);
  }
  Id id;
  std::copy(raw.begin(), raw.end(), id.bytes.begin());
  return Result<Id, IdError>::ok(id);
}

std::ostream& operator<<(std::ostream& os, const Id& id) {
  return os << id.to_string();
}

std::istream& operator>>(std::istream& is, Id& id) {
  std::string token;
  if (!(is >> token)) {
    return is;
  }
  auto parsed = decode(token);
  if (!parsed.has_value()) {
    is.setstate(std::ios_base::failbit);
    return is;
  }
  id = parsed.value();
  return is;
}

}  // namespace xid::core

namespace std {

size_t hash<xid::core::Id>::operator()(const xid::core::Id& id) const noexcept {
  return static_cast<size_t>(xid::core::stable_hash64(id.bytes));
}

}  // namespace std
