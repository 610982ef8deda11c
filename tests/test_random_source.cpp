#include "xid/core/random_source.h"

#include <catch2/catch.hpp>

#include <array>
#include <cstdint>

using namespace xid;

TEST_CASE("SystemRandomSource fills every requested byte", "[random]") {
  core::SystemRandomSource random;

  std::array<std::uint8_t, 64> first{};
  std::array<std::uint8_t, 64> second{};
  random.fill(first);
  random.fill(second);

  // 2^-512 chance of a false failure.
  CHECK(first != second);

  std::array<std::uint8_t, 3> odd_size{};
  CHECK_NOTHROW(random.fill(odd_size));
  CHECK_NOTHROW(random.fill(std::span<std::uint8_t>{}));
}

TEST_CASE("SequenceRandomSource counts up and wraps", "[random]") {
  core::SequenceRandomSource random(0xFE);
  std::array<std::uint8_t, 4> out{};
  random.fill(out);
  CHECK(out == std::array<std::uint8_t, 4>{0xFE, 0xFF, 0x00, 0x01});

  random.fill(std::span<std::uint8_t>(out).first(1));
  CHECK(out[0] == 0x02);
}
