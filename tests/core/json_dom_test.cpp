#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

TEST_CASE("JSON DOM parses nested objects and arrays", "[core][json]") {
  benchdiff::core::json::Value root;
  std::string error;
  REQUIRE(benchdiff::core::json::Parse(
      R"({"results":[{"name":"mint","totalGateCount":12}],"ok":true,"none":null})", root, error));
  REQUIRE(root.IsObject());

  const auto* results = benchdiff::core::json::FindField(root, "results");
  REQUIRE(results != nullptr);
  REQUIRE(results->IsArray());
  REQUIRE(results->array_value.size() == 1U);

  const auto* name = benchdiff::core::json::FindField(results->array_value.front(), "name");
  REQUIRE(name != nullptr);
  REQUIRE(name->string_value == "mint");
  REQUIRE(benchdiff::core::json::FindField(root, "missing") == nullptr);
}

TEST_CASE("JSON DOM reports position of syntax errors", "[core][json]") {
  benchdiff::core::json::Value root;
  std::string error;
  REQUIRE_FALSE(benchdiff::core::json::Parse("{\n  \"a\": 1,\n}", root, error));
  REQUIRE(error.find("parse error at line 3") != std::string::npos);

  REQUIRE_FALSE(benchdiff::core::json::Parse("[1, 2] 3", root, error));
  REQUIRE(error.find("trailing content") != std::string::npos);
}

TEST_CASE("JSON DOM decodes unicode escapes to UTF-8", "[core][json]") {
  benchdiff::core::json::Value root;
  std::string error;
  REQUIRE(benchdiff::core::json::Parse(R"("café 🚀")", root, error));
  REQUIRE(root.string_value == "café 🚀");
}

TEST_CASE("Non-negative integer extraction rejects fractions and negatives", "[core][json]") {
  benchdiff::core::json::Value value;
  value.type = benchdiff::core::json::Value::Type::kNumber;
  std::uint64_t out = 0;

  value.number_value = 42.0;
  REQUIRE(benchdiff::core::json::TryGetNonNegativeInteger(value, out));
  REQUIRE(out == 42U);

  value.number_value = 1.5;
  REQUIRE_FALSE(benchdiff::core::json::TryGetNonNegativeInteger(value, out));
  value.number_value = -1.0;
  REQUIRE_FALSE(benchdiff::core::json::TryGetNonNegativeInteger(value, out));
}

TEST_CASE("JSON string quoting escapes control characters", "[core][json]") {
  REQUIRE(benchdiff::core::QuoteJson("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
}
