// ─────────────────────────────────────────────────────────────────────────────
// Tool Argument Shaping Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpc/service/tool_arguments.hpp"

using namespace mcpc;

namespace {

const Json kSchema = Json::parse(R"({
    "type": "object",
    "properties": {
        "paths":   {"type": "array", "items": {"type": "string"}},
        "exclude": {"type": "array", "items": {"type": "string"}},
        "tags":    {"type": "array"},
        "query":   {"type": "string"}
    },
    "required": ["paths", "query"]
})");

}  // namespace

TEST_CASE("Required empty arrays are sent as empty arrays", "[tool_arguments]") {
    auto shaped = shape_tool_arguments(kSchema, Json{{"paths", Json::array()}, {"query", "x"}});
    REQUIRE(shaped["paths"].is_array());
    REQUIRE(shaped["paths"].empty());
}

TEST_CASE("Optional empty arrays are omitted", "[tool_arguments]") {
    auto shaped = shape_tool_arguments(kSchema, Json{
        {"paths", Json::array({"a"})},
        {"exclude", Json::array()},
        {"query", "x"}
    });
    REQUIRE(shaped.contains("exclude") == false);
    REQUIRE(shaped["paths"] == Json::array({"a"}));
}

TEST_CASE("Null values for array properties follow the same rule", "[tool_arguments]") {
    auto shaped = shape_tool_arguments(kSchema, Json{
        {"paths", nullptr},
        {"tags", nullptr},
        {"query", "x"}
    });
    REQUIRE(shaped["paths"] == Json::array());
    REQUIRE(shaped.contains("tags") == false);
}

TEST_CASE("Non-array values are untouched", "[tool_arguments]") {
    Json args{{"paths", Json::array({"a", "b"})}, {"query", ""}, {"extra", nullptr}};
    auto shaped = shape_tool_arguments(kSchema, args);
    REQUIRE(shaped == args);
}

TEST_CASE("Missing required keys are not invented", "[tool_arguments]") {
    auto shaped = shape_tool_arguments(kSchema, Json{{"query", "x"}});
    REQUIRE(shaped.contains("paths") == false);
}

TEST_CASE("Without a schema arguments pass through", "[tool_arguments]") {
    Json args{{"list", Json::array()}};
    REQUIRE(shape_tool_arguments(Json(), args) == args);
    REQUIRE(shape_tool_arguments(kSchema, Json::array()) == Json::array());
}
