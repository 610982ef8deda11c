#include "xid/core/codec.h"

#include <array>
#include <cstdint>

namespace xid::core {

namespace {

constexpr std::uint8_t kInvalidSymbol = 0xFF;

constexpr std::array<std::uint8_t, 256> make_decoding_table() {
  std::array<std::uint8_t, 256> table{};
  for (auto& entry : table) {
    entry = kInvalidSymbol;
  }
  for (std::size_t i = 0; i < kEncoding.size(); ++i) {
    table[static_cast<unsigned char>(kEncoding[i])] = static_cast<std::uint8_t>(i);
  }
  return table;
}

constexpr std::array<std::uint8_t, 256> kDecoding = make_decoding_table();

std::uint8_t symbol(const std::string_view text, const std::size_t i) {
  return kDecoding[static_cast<unsigned char>(text[i])];
}

}  // namespace

void encode_to(const Id& id, char* dst) {
  const auto& b = id.bytes;
  // Each symbol takes 5 bits starting at bit 5*i; symbols 1, 3, 4, 6, 9, 11, 12, 14, 17
  // straddle two bytes.
  dst[0] = kEncoding[b[0] >> 3];
  dst[1] = kEncoding[((b[1] >> 6) & 0x1F) | ((b[0] << 2) & 0x1F)];
  dst[2] = kEncoding[(b[1] >> 1) & 0x1F];
  dst[3] = kEncoding[((b[2] >> 4) & 0x1F) | ((b[1] << 4) & 0x1F)];
  dst[4] = kEncoding[(b[3] >> 7) | ((b[2] << 1) & 0x1F)];
  dst[5] = kEncoding[(b[3] >> 2) & 0x1F];
  dst[6] = kEncoding[(b[4] >> 5) | ((b[3] << 3) & 0x1F)];
  dst[7] = kEncoding[b[4] & 0x1F];
  dst[8] = kEncoding[b[5] >> 3];
  dst[9] = kEncoding[((b[6] >> 6) & 0x1F) | ((b[5] << 2) & 0x1F)];
  dst[10] = kEncoding[(b[6] >> 1) & 0x1F];
  dst[11] = kEncoding[((b[7] >> 4) & 0x1F) | ((b[6] << 4) & 0x1F)];
  dst[12] = kEncoding[(b[8] >> 7) | ((b[7] << 1) & 0x1F)];
  dst[13] = kEncoding[(b[8] >> 2) & 0x1F];
  dst[14] = kEncoding[(b[9] >> 5) | ((b[8] << 3) & 0x1F)];
  dst[15] = kEncoding[b[9] & 0x1F];
  dst[16] = kEncoding[b[10] >> 3];
  dst[17] = kEncoding[((b[11] >> 6) & 0x1F) | ((b[10] << 2) & 0x1F)];
  dst[18] = kEncoding[(b[11] >> 1) & 0x1F];
  dst[19] = kEncoding[(b[11] << 4) & 0x1F];
}

std::string encode(const Id& id) {
  std::string text(kEncodedLen, '\0');
  encode_to(id, text.data());
  return text;
}

bool is_valid(const std::string_view text) {
  if (text.size() != kEncodedLen) {
    return false;
  }
  for (std::size_t i = 0; i < kEncodedLen; ++i) {
    if (symbol(text, i) == kInvalidSymbol) {
      return false;
    }
  }
  // Only the top bit of the last symbol carries payload.
  return (symbol(text, kEncodedLen - 1) & 0x0F) == 0;
}

Result<Id, IdError> decode(const std::string_view text) {
  if (!is_valid(text)) {
    return Result<Id, IdError>::err(IdError::kInvalidId);
  }

  std::array<std::uint8_t, kEncodedLen> s{};
  for (std::size_t i = 0; i < kEncodedLen; ++i) {
    s[i] = symbol(text, i);
  }

  Id id;
  auto& b = id.bytes;
  b[0] = static_cast<std::uint8_t>((s[0] << 3) | (s[1] >> 2));
  b[1] = static_cast<std::uint8_t>((s[1] << 6) | (s[2] << 1) | (s[3] >> 4));
  b[2] = static_cast<std::uint8_t>((s[3] << 4) | (s[4] >> 1));
  b[3] = static_cast<std::uint8_t>((s[4] << 7) | (s[5] << 2) | (s[6] >> 3));
  b[4] = static_cast<std::uint8_t>((s[6] << 5) | s[7]);
  b[5] = static_cast<std::uint8_t>((s[8] << 3) | (s[9] >> 2));
  b[6] = static_cast<std::uint8_t>((s[9] << 6) | (s[10] << 1) | (s[11] >> 4));
  b[7] = static_cast<std::uint8_t>((s[11] << 4) | (s[12] >> 1));
  b[8] = static_cast<std::uint8_t>((s[12] << 7) | (s[13] << 2) | (s[14] >> 3));
  b[9] = static_cast<std::uint8_t>((s[14] << 5) | s[15]);
  b[10] = static_cast<std::uint8_t>((s[16] << 3) | (s[17] >> 2));
  b[11] = static_cast<std::uint8_t>((s[17] << 6) | (s[18] << 1) | (s[19] >> 4));
  return Result<Id, IdError>::ok(id);
}

}  // namespace xid::core
