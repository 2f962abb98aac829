// ─────────────────────────────────────────────────────────────────────────────
// HttpTransport Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpc/protocol/json_rpc.hpp"
#include "mcpc/transport/http_transport.hpp"
#include "mocks/mock_http_client.hpp"

#include <vector>

using namespace mcpc;
using namespace mcpc::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

HttpTransportConfig http_config() {
    HttpTransportConfig config;
    config.url = "https://mcp.example.com/mcp";
    config.headers = {{"Authorization", "Bearer abc"}};
    config.connect_timeout = 3s;
    return config;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Start
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HTTP transport configures the client on start", "[transport][http]") {
    auto http = std::make_shared<MockHttpClient>();
    HttpTransport transport(http_config(), http);

    REQUIRE(transport.start(1s).has_value());
    REQUIRE(http->default_headers().at("Authorization") == "Bearer abc");
    REQUIRE(http->connect_timeout() == 3s);
    REQUIRE(http->requests().empty());
}

TEST_CASE("HTTP transport rejects invalid URLs", "[transport][http]") {
    auto config = http_config();
    config.url = "not a url";
    HttpTransport transport(config, std::make_shared<MockHttpClient>());

    auto started = transport.start(1s);
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().category == ErrorCategory::Transport);
}

TEST_CASE("HTTP transport requires start", "[transport][http]") {
    HttpTransport transport(http_config(), std::make_shared<MockHttpClient>());
    REQUIRE_FALSE(transport.send_request(make_request(1, "ping"), 1s).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HTTP transport returns JSON replies", "[transport][http]") {
    auto http = std::make_shared<MockHttpClient>();
    http->queue_json_response(200, R"({"jsonrpc":"2.0","id":4,"result":{"tools":[]}})");

    HttpTransport transport(http_config(), http);
    REQUIRE(transport.start(1s).has_value());

    auto response = transport.send_request(make_request(4, "tools/list"), 2s);
    REQUIRE(response.has_value());
    REQUIRE((*response)["result"]["tools"].is_array());

    auto sent = http->last_request();
    REQUIRE(sent->method == HttpMethod::Post);
    REQUIRE(sent->url == "https://mcp.example.com/mcp");
    REQUIRE(sent->timeout == 2s);
    REQUIRE_THAT(sent->headers.at("Accept"), ContainsSubstring("text/event-stream"));
}

TEST_CASE("HTTP transport reads responses from event-stream bodies", "[transport][http]") {
    auto http = std::make_shared<MockHttpClient>();
    http->queue_sse_response(
        "event: message\n"
        "data: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\",\"params\":{\"progress\":1}}\n\n"
        "event: message\n"
        "data: {\"jsonrpc\":\"2.0\",\"id\":9,\"result\":{\"content\":[]}}\n");

    HttpTransport transport(http_config(), http);
    std::vector<std::string> notifications;
    transport.set_notification_handler([&](const Json& message) {
        notifications.emplace_back(message_method(message));
    });
    REQUIRE(transport.start(1s).has_value());

    auto response = transport.send_request(make_request(9, "tools/call"), 2s);
    REQUIRE(response.has_value());
    REQUIRE((*response)["id"] == 9);
    REQUIRE(notifications == std::vector<std::string>{"notifications/progress"});
}

TEST_CASE("HTTP transport reports event streams without the response", "[transport][http]") {
    auto http = std::make_shared<MockHttpClient>();
    http->queue_sse_response("event: message\ndata: {\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n\n");

    HttpTransport transport(http_config(), http);
    REQUIRE(transport.start(1s).has_value());

    auto response = transport.send_request(make_request(2, "ping"), 1s);
    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().category == ErrorCategory::Protocol);
}

TEST_CASE("HTTP transport rejects replies for another id", "[transport][http]") {
    auto http = std::make_shared<MockHttpClient>();
    http->queue_json_response(200, R"({"jsonrpc":"2.0","id":8,"result":{}})");

    HttpTransport transport(http_config(), http);
    REQUIRE(transport.start(1s).has_value());

    auto response = transport.send_request(make_request(7, "ping"), 1s);
    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().category == ErrorCategory::Protocol);
}

TEST_CASE("HTTP error status becomes a transport error", "[transport][http]") {
    auto http = std::make_shared<MockHttpClient>();
    http->queue_response(500, "Internal Server Error");

    HttpTransport transport(http_config(), http);
    REQUIRE(transport.start(1s).has_value());

    auto response = transport.send_request(make_request(1, "ping"), 1s);
    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().category == ErrorCategory::Transport);
    REQUIRE(response.error().http_status == 500);
    REQUIRE(response.error().evidence == "Internal Server Error");
}

TEST_CASE("HTTP client failures become transport errors", "[transport][http]") {
    auto http = std::make_shared<MockHttpClient>();
    http->queue_connection_error("Connection refused");

    HttpTransport transport(http_config(), http);
    REQUIRE(transport.start(1s).has_value());

    auto response = transport.send_request(make_request(1, "ping"), 1s);
    REQUIRE_FALSE(response.has_value());
    REQUIRE_THAT(response.error().message, ContainsSubstring("Connection refused"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Sessions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HTTP session id is captured, replayed and released", "[transport][http][session]") {
    auto http = std::make_shared<MockHttpClient>();
    http->queue_response_with_session(200, R"({"jsonrpc":"2.0","id":1,"result":{}})", "sess-42");

    HttpTransport transport(http_config(), http);
    REQUIRE(transport.start(1s).has_value());

    REQUIRE(transport.send_request(make_request(1, "initialize"), 1s).has_value());
    REQUIRE(transport.session_id() == "sess-42");

    REQUIRE(transport.send_notification(make_notification("notifications/initialized")).has_value());
    REQUIRE(http->last_request()->headers.at("Mcp-Session-Id") == "sess-42");

    transport.close();
    REQUIRE(http->count(HttpMethod::Delete) == 1);
    REQUIRE(http->last_request()->headers.at("Mcp-Session-Id") == "sess-42");
    REQUIRE_FALSE(transport.session_id().has_value());

    transport.close();
    REQUIRE(http->count(HttpMethod::Delete) == 1);
}

TEST_CASE("HTTP close without a session sends nothing", "[transport][http][session]") {
    auto http = std::make_shared<MockHttpClient>();
    HttpTransport transport(http_config(), http);
    REQUIRE(transport.start(1s).has_value());

    transport.close();
    REQUIRE(http->requests().empty());
}

TEST_CASE("HTTP 404 with a session reports an expired session", "[transport][http][session]") {
    auto http = std::make_shared<MockHttpClient>();
    http->queue_response_with_session(200, R"({"jsonrpc":"2.0","id":1,"result":{}})", "sess-1");
    http->queue_response(404, "unknown session");

    HttpTransport transport(http_config(), http);
    REQUIRE(transport.start(1s).has_value());
    REQUIRE(transport.send_request(make_request(1, "initialize"), 1s).has_value());

    auto response = transport.send_request(make_request(2, "ping"), 1s);
    REQUIRE_FALSE(response.has_value());
    REQUIRE_THAT(response.error().message, ContainsSubstring("session expired"));
    REQUIRE_FALSE(transport.session_id().has_value());
}
