// ─────────────────────────────────────────────────────────────────────────────
// JSON-RPC Envelope Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpc/json/json.hpp"
#include "mcpc/protocol/json_rpc.hpp"

using namespace mcpc;
using Catch::Matchers::ContainsSubstring;

// ═══════════════════════════════════════════════════════════════════════════
// Building
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("make_request builds a 2.0 request", "[jsonrpc]") {
    auto request = make_request(7, "tools/list", Json{{"cursor", "abc"}});

    REQUIRE(request["jsonrpc"] == "2.0");
    REQUIRE(request["id"] == 7);
    REQUIRE(request["method"] == "tools/list");
    REQUIRE(request["params"]["cursor"] == "abc");
    REQUIRE(classify_message(request) == MessageType::Request);
}

TEST_CASE("make_request omits absent params", "[jsonrpc]") {
    auto request = make_request(1, "ping");
    REQUIRE(request.contains("params") == false);
}

TEST_CASE("make_notification has no id", "[jsonrpc]") {
    auto notification = make_notification("notifications/initialized");
    REQUIRE(notification.contains("id") == false);
    REQUIRE(classify_message(notification) == MessageType::Notification);
}

TEST_CASE("make_error_response echoes the request id", "[jsonrpc]") {
    auto response = make_error_response(Json(12), rpc_code::kMethodNotFound, "nope");
    REQUIRE(response["id"] == 12);
    REQUIRE(response["error"]["code"] == -32601);
    REQUIRE(response["error"]["message"] == "nope");
    REQUIRE(classify_message(response) == MessageType::Response);
}

// ═══════════════════════════════════════════════════════════════════════════
// Classification and ids
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("classify_message distinguishes message shapes", "[jsonrpc]") {
    REQUIRE(classify_message(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", Json::object()}}) ==
            MessageType::Response);
    REQUIRE(classify_message(Json{{"jsonrpc", "2.0"}, {"id", nullptr},
                                  {"error", {{"code", -32700}, {"message", "parse"}}}}) ==
            MessageType::Response);
    REQUIRE(classify_message(Json{{"jsonrpc", "2.0"}, {"method", "notifications/progress"}}) ==
            MessageType::Notification);
    REQUIRE(classify_message(Json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "roots/list"}}) ==
            MessageType::Request);
    REQUIRE(classify_message(Json::array()) == MessageType::Invalid);
    REQUIRE(classify_message(Json{{"hello", "world"}}) == MessageType::Invalid);
}

TEST_CASE("message_id accepts integer and numeric string ids", "[jsonrpc]") {
    REQUIRE(message_id(Json{{"id", 42}}) == 42);
    REQUIRE(message_id(Json{{"id", "42"}}) == 42);
    REQUIRE_FALSE(message_id(Json{{"id", "abc"}}).has_value());
    REQUIRE_FALSE(message_id(Json{{"id", "4x"}}).has_value());
    REQUIRE_FALSE(message_id(Json{{"method", "ping"}}).has_value());
}

TEST_CASE("message_method returns empty for responses", "[jsonrpc]") {
    REQUIRE(message_method(Json{{"method", "ping"}}) == "ping");
    REQUIRE(message_method(Json{{"id", 1}, {"result", 1}}).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// extract_result
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("extract_result returns the result member", "[jsonrpc]") {
    auto result = extract_result(Json{{"id", 1}, {"result", {{"tools", Json::array()}}}});
    REQUIRE(result.has_value());
    REQUIRE(result->contains("tools"));
}

TEST_CASE("extract_result turns error members into protocol errors", "[jsonrpc]") {
    auto result = extract_result(Json{
        {"id", 1},
        {"error", {{"code", -32602}, {"message", "Invalid params"}, {"data", {{"field", "path"}}}}}
    });

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category == ErrorCategory::Protocol);
    REQUIRE(result.error().rpc_code == -32602);
    REQUIRE_THAT(result.error().message, ContainsSubstring("Invalid params"));
    REQUIRE(result.error().evidence.has_value());
    REQUIRE_THAT(*result.error().evidence, ContainsSubstring("path"));
}

TEST_CASE("extract_result rejects malformed responses", "[jsonrpc]") {
    auto malformed = extract_result(Json{{"id", 1}, {"error", "boom"}});
    REQUIRE_FALSE(malformed.has_value());
    REQUIRE_FALSE(malformed.error().rpc_code.has_value());

    auto empty = extract_result(Json{{"id", 1}});
    REQUIRE_FALSE(empty.has_value());
    REQUIRE_THAT(empty.error().message, ContainsSubstring("neither result nor error"));
}

// ═══════════════════════════════════════════════════════════════════════════
// parse_json
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("parse_json converts documents", "[json]") {
    auto parsed = parse_json(R"({"a":[1,2.5,"x",true,null],"b":{"c":-3}})");
    REQUIRE(parsed.has_value());
    REQUIRE((*parsed)["a"].size() == 5);
    REQUIRE((*parsed)["a"][1] == 2.5);
    REQUIRE((*parsed)["b"]["c"] == -3);
}

TEST_CASE("parse_json reports invalid text with evidence", "[json]") {
    auto parsed = parse_json("Starting server...");
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().category == ErrorCategory::Protocol);
    REQUIRE(parsed.error().evidence == "Starting server...");
}

TEST_CASE("parse_json limits nesting depth", "[json]") {
    std::string deep(kMaxJsonDepth + 2, '[');
    deep += std::string(kMaxJsonDepth + 2, ']');
    auto parsed = parse_json(deep);
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE_THAT(parsed.error().message, ContainsSubstring("nesting"));
}

TEST_CASE("excerpt truncates long text", "[json]") {
    REQUIRE(excerpt("short") == "short");
    auto long_text = std::string(500, 'x');
    auto cut = excerpt(long_text);
    REQUIRE(cut.size() == 203);
    REQUIRE(cut.ends_with("..."));
}
