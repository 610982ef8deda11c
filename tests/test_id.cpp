#include "xid/core/id.h"
#include "xid/core/time.h"

#include <catch2/catch.hpp>

#include <array>
#include <set>
#include <sstream>
#include <unordered_set>
#include <vector>

using namespace xid;

namespace {

const core::Id kReference{{0x4d, 0x88, 0xe1, 0x5b, 0x60, 0xf4, 0x86, 0xe4, 0x28, 0x41, 0x2d, 0xc9}};

}  // namespace

// ── Accessors ───────────────────────────────────────────────────────────────

TEST_CASE("Id::time reads the 48-bit big-endian prefix", "[id][accessors]") {
  CHECK(kReference.time() == 0x4d88e15b60f4ull);
  CHECK(kReference.time() == 85250291753204ull);
  CHECK(core::to_unix_nanos(kReference.timestamp()) == kReference.time());
}

TEST_CASE("Id::counter reads the 48-bit big-endian suffix", "[id][accessors]") {
  CHECK(kReference.counter() == 0x86e428412dc9ull);
  CHECK(kReference.counter() == 148314486025673ull);
}

TEST_CASE("Id accessors accept any 12 bytes", "[id][accessors]") {
  core::Id id;
  id.bytes.fill(0xFF);
  CHECK(id.time() == 0xFFFFFFFFFFFFull);
  CHECK(id.counter() == 0xFFFFFFFFFFFFull);
  CHECK((id.time() >> 48) == 0);
}

TEST_CASE("Id::nil is all zero", "[id]") {
  const auto nil = core::Id::nil();
  CHECK(nil.is_nil());
  CHECK(nil.time() == 0);
  CHECK(nil.counter() == 0);
  CHECK(nil.to_string() == "00000000000000000000");
  CHECK_FALSE(kReference.is_nil());
}

// ── Construction ────────────────────────────────────────────────────────────

TEST_CASE("Id::from_string parses the text form", "[id]") {
  const auto parsed = core::Id::from_string("9m4e2mr0ui3e8a215n4g");
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == kReference);
  CHECK(parsed.value().to_string() == "9m4e2mr0ui3e8a215n4g");

  CHECK_FALSE(core::Id::from_string("not-an-id").has_value());
}

TEST_CASE("Id::from_bytes requires exactly 12 bytes", "[id]") {
  const std::vector<std::uint8_t> raw(kReference.bytes.begin(), kReference.bytes.end());
  const auto parsed = core::Id::from_bytes(raw);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == kReference);

  const std::vector<std::uint8_t> short_raw(11, 0x01);
  CHECK_FALSE(core::Id::from_bytes(short_raw).has_value());

  const std::vector<std::uint8_t> long_raw(13, 0x01);
  CHECK_FALSE(core::Id::from_bytes(long_raw).has_value());
}

// ── Value semantics ─────────────────────────────────────────────────────────

TEST_CASE("Id copies are independent values", "[id]") {
  core::Id copy = kReference;
  copy.bytes[11] = 0x00;
  CHECK(copy != kReference);
  CHECK(kReference.bytes[11] == 0xc9);
}

TEST_CASE("Id orders byte-lexicographically", "[id][ordering]") {
  core::Id earlier;
  earlier.bytes[5] = 0x01;
  core::Id later;
  later.bytes[4] = 0x01;
  core::Id later_suffix = later;
  later_suffix.bytes[11] = 0x01;

  CHECK(earlier < later);
  CHECK(later < later_suffix);
  CHECK(earlier.time() < later.time());

  const std::set<core::Id> sorted{later_suffix, earlier, later};
  const std::vector<core::Id> in_order(sorted.begin(), sorted.end());
  CHECK(in_order == std::vector<core::Id>{earlier, later, later_suffix});
}

TEST_CASE("Id works as an unordered key", "[id]") {
  std::unordered_set<core::Id> ids;
  ids.insert(kReference);
  ids.insert(kReference);
  ids.insert(core::Id::nil());
  CHECK(ids.size() == 2);
  CHECK(std::hash<core::Id>{}(kReference) == std::hash<core::Id>{}(core::Id{kReference}));
}

// ── Stream hooks ────────────────────────────────────────────────────────────

TEST_CASE("operator<< writes the text form", "[id][stream]") {
  std::ostringstream oss;
  oss << kReference;
  CHECK(oss.str() == "9m4e2mr0ui3e8a215n4g");
}

TEST_CASE("operator>> reads whitespace-delimited ids", "[id][stream]") {
  std::istringstream iss("  9m4e2mr0ui3e8a215n4g 00000000000000000000\n");
  core::Id first;
  core::Id second = kReference;
  iss >> first >> second;
  REQUIRE_FALSE(iss.fail());
  CHECK(first == kReference);
  CHECK(second.is_nil());
}

TEST_CASE("operator>> sets failbit and keeps the target on invalid input", "[id][stream]") {
  std::istringstream iss("9M4E2MR0UI3E8A215N4G");
  core::Id target = kReference;
  iss >> target;
  CHECK(iss.fail());
  CHECK(target == kReference);
}
