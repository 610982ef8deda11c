#include "xid/core/id.h"
#include "xid/core/id_json.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace xid;

namespace {

const core::Id kReference{{0x4d, 0x88, 0xe1, 0x5b, 0x60, 0xf4, 0x86, 0xe4, 0x28, 0x41, 0x2d, 0xc9}};

}  // namespace

TEST_CASE("Id serializes as its text form", "[json]") {
  const nlohmann::json j = kReference;
  REQUIRE(j.is_string());
  CHECK(j.get<std::string>() == "9m4e2mr0ui3e8a215n4g");
  CHECK(j.dump() == R"("9m4e2mr0ui3e8a215n4g")");
}

TEST_CASE("Id deserializes from a JSON document", "[json]") {
  const auto doc = nlohmann::json::parse(R"({"id":"9m4e2mr0ui3e8a215n4g","refs":["00000000000000000000"]})");
  CHECK(doc["id"].get<core::Id>() == kReference);

  const auto refs = doc["refs"].get<std::vector<core::Id>>();
  REQUIRE(refs.size() == 1);
  CHECK(refs[0].is_nil());
}

TEST_CASE("Id containers round-trip through JSON", "[json]") {
  const std::map<std::string, core::Id> by_name{{"nil", core::Id::nil()}, {"ref", kReference}};
  const nlohmann::json j = by_name;
  CHECK(j.get<std::map<std::string, core::Id>>() == by_name);
}

TEST_CASE("from_json rejects invalid text", "[json][validation]") {
  core::Id target = kReference;
  CHECK_THROWS_AS(nlohmann::json("9M4E2MR0UI3E8A215N4G").get_to(target), std::invalid_argument);
  CHECK_THROWS_AS(nlohmann::json("123").get<core::Id>(), std::invalid_argument);
  CHECK(target == kReference);
}

TEST_CASE("from_json rejects non-string values", "[json][validation]") {
  CHECK_THROWS_AS(nlohmann::json(42).get<core::Id>(), nlohmann::json::type_error);
  CHECK_THROWS_AS(nlohmann::json::array().get<core::Id>(), nlohmann::json::type_error);
  CHECK_THROWS_AS(nlohmann::json(nullptr).get<core::Id>(), nlohmann::json::type_error);
}
