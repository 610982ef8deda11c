#include "xid/core/codec.h"
#include "xid/core/id.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <random>
#include <string>

using namespace xid;

namespace {

const core::Id kReference{{0x4d, 0x88, 0xe1, 0x5b, 0x60, 0xf4, 0x86, 0xe4, 0x28, 0x41, 0x2d, 0xc9}};
constexpr const char* kReferenceText = "9m4e2mr0ui3e8a215n4g";

core::Id random_id(std::mt19937_64& rng) {
  core::Id id;
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto& byte : id.bytes) {
    byte = static_cast<std::uint8_t>(dist(rng));
  }
  return id;
}

}  // namespace

// ── encode ──────────────────────────────────────────────────────────────────

TEST_CASE("encode: all-zero id is twenty '0' characters", "[codec]") {
  const auto text = core::encode(core::Id::nil());
  CHECK(text == std::string(20, '0'));
  CHECK(text.size() == core::kEncodedLen);
}

TEST_CASE("encode: reference vector", "[codec]") {
  CHECK(core::encode(kReference) == kReferenceText);
}

TEST_CASE("encode: all-ones id leaves the padding bits clear", "[codec]") {
  core::Id id;
  id.bytes.fill(0xFF);
  CHECK(core::encode(id) == "vvvvvvvvvvvvvvvvvvvg");
}

TEST_CASE("encode: single low bits land in the expected symbols", "[codec]") {
  core::Id last_bit;
  last_bit.bytes[11] = 0x01;
  CHECK(core::encode(last_bit) == "0000000000000000000g");

  core::Id high_bit_of_last_byte;
  high_bit_of_last_byte.bytes[11] = 0x80;
  CHECK(core::encode(high_bit_of_last_byte) == "00000000000000000200");
}

TEST_CASE("encode_to writes exactly twenty characters", "[codec]") {
  std::string buffer(24, '#');
  core::encode_to(kReference, buffer.data());
  CHECK(buffer.substr(0, 20) == kReferenceText);
  CHECK(buffer.substr(20) == "####");
}

// ── decode ──────────────────────────────────────────────────────────────────

TEST_CASE("decode: reference vector", "[codec]") {
  const auto result = core::decode(kReferenceText);
  REQUIRE(result.has_value());
  CHECK(result.value() == kReference);
}

TEST_CASE("decode: rejects wrong lengths", "[codec][validation]") {
  CHECK_FALSE(core::decode("").has_value());
  CHECK_FALSE(core::decode("123").has_value());
  CHECK_FALSE(core::decode("9m4e2mr0ui3e8a215n4").has_value());
  CHECK_FALSE(core::decode("9m4e2mr0ui3e8a215n4g0").has_value());

  const auto result = core::decode("123");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error() == core::IdError::kInvalidId);
  CHECK(core::to_string(result.error()) == "xid: invalid ID");
}

TEST_CASE("decode: rejects characters outside the alphabet", "[codec][validation]") {
  CHECK_FALSE(core::decode("9m4e2mr0ui3e8a215nzg").has_value());
  CHECK_FALSE(core::decode("w0000000000000000000").has_value());
  CHECK_FALSE(core::decode("0000000000-000000000").has_value());
  CHECK_FALSE(core::decode("000000000 0000000000").has_value());

  std::string with_nul(20, '0');
  with_nul[5] = '\0';
  CHECK_FALSE(core::decode(with_nul).has_value());

  std::string high_byte(20, '0');
  high_byte[3] = static_cast<char>(0xC3);
  CHECK_FALSE(core::decode(high_byte).has_value());
}

TEST_CASE("decode: uppercase is not accepted", "[codec][validation]") {
  CHECK_FALSE(core::decode("9M4E2MR0UI3E8A215N4G").has_value());
  CHECK_FALSE(core::decode("9m4e2mr0ui3e8a215n4G").has_value());
}

TEST_CASE("decode: rejects non-canonical padding in the last symbol", "[codec][validation]") {
  CHECK(core::decode("0000000000000000000g").has_value());
  CHECK_FALSE(core::decode("00000000000000000001").has_value());
  CHECK_FALSE(core::decode("0000000000000000000h").has_value());
  CHECK_FALSE(core::decode("0000000000000000000v").has_value());
  CHECK_FALSE(core::is_valid("9m4e2mr0ui3e8a215n4h"));
}

TEST_CASE("is_valid agrees with decode", "[codec][validation]") {
  CHECK(core::is_valid(kReferenceText));
  CHECK(core::is_valid(std::string(20, '0')));
  CHECK_FALSE(core::is_valid("123"));
  CHECK_FALSE(core::is_valid("zzzzzzzzzzzzzzzzzzzz"));
}

// ── Round trip and ordering ─────────────────────────────────────────────────

TEST_CASE("decode(encode(x)) == x for sampled ids", "[codec][roundtrip]") {
  std::mt19937_64 rng(20260101);
  for (int i = 0; i < 2000; ++i) {
    const auto id = random_id(rng);
    const auto decoded = core::decode(core::encode(id));
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == id);
  }
}

TEST_CASE("encode(decode(s)) == s for sampled canonical strings", "[codec][roundtrip]") {
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<std::size_t> symbol(0, core::kEncoding.size() - 1);
  std::uniform_int_distribution<int> top_bit(0, 1);

  for (int i = 0; i < 2000; ++i) {
    std::string text;
    for (std::size_t k = 0; k + 1 < core::kEncodedLen; ++k) {
      text += core::kEncoding[symbol(rng)];
    }
    text += top_bit(rng) == 0 ? '0' : 'g';

    const auto decoded = core::decode(text);
    REQUIRE(decoded.has_value());
    CHECK(core::encode(decoded.value()) == text);
  }
}

TEST_CASE("text order matches byte order", "[codec][ordering]") {
  std::mt19937_64 rng(7);
  for (int i = 0; i < 2000; ++i) {
    const auto a = random_id(rng);
    auto b = random_id(rng);
    if (i % 4 == 0) {
      // Share a prefix so later symbols decide the comparison.
      std::copy_n(a.bytes.begin(), 6, b.bytes.begin());
    }
    CHECK((a < b) == (core::encode(a) < core::encode(b)));
    CHECK((a == b) == (core::encode(a) == core::encode(b)));
  }
}
