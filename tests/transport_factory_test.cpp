// ─────────────────────────────────────────────────────────────────────────────
// TransportFactory Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpc/transport/event_stream_transport.hpp"
#include "mcpc/transport/http_transport.hpp"
#include "mcpc/transport/transport_factory.hpp"
#include "mocks/mock_http_client.hpp"

using namespace mcpc;
using namespace mcpc::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

TransportFactory mock_factory(std::shared_ptr<MockHttpClient> http) {
    return TransportFactory([http] { return std::shared_ptr<IHttpClient>(http); });
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Context strategy
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Event-stream connections are not bound to the caller deadline", "[factory][context]") {
    auto strategy = context_strategy(TransportKind::EventStream, 5s);
    REQUIRE_FALSE(strategy.connect_timeout.has_value());
    REQUIRE(strategy.request_timeout == 5s);
}

TEST_CASE("Stdio and http connections use the caller deadline", "[factory][context]") {
    for (auto kind : {TransportKind::Stdio, TransportKind::Http}) {
        auto strategy = context_strategy(kind, 1500ms);
        REQUIRE(strategy.connect_timeout == 1500ms);
        REQUIRE(strategy.request_timeout == 1500ms);
    }
}

TEST_CASE("Transport kind names parse", "[factory]") {
    REQUIRE(parse_transport_kind("stdio") == TransportKind::Stdio);
    REQUIRE(parse_transport_kind("sse") == TransportKind::EventStream);
    REQUIRE(parse_transport_kind("event-stream") == TransportKind::EventStream);
    REQUIRE(parse_transport_kind("streamable-http") == TransportKind::Http);
    REQUIRE_FALSE(parse_transport_kind("websocket").has_value());
    REQUIRE(to_string(TransportKind::EventStream) == "event-stream");
}

// ═══════════════════════════════════════════════════════════════════════════
// build
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Stdio build requires a command and a process", "[factory]") {
    TransportFactory factory(mock_factory(std::make_shared<MockHttpClient>()));

    ConnectionConfig config;
    config.transport = TransportKind::Stdio;

    auto no_command = factory.build(config, nullptr);
    REQUIRE_FALSE(no_command.has_value());
    REQUIRE(no_command.error().category == ErrorCategory::Transport);
    REQUIRE_THAT(no_command.error().message, ContainsSubstring("command"));

    config.command = "/bin/cat";
    auto no_process = factory.build(config, nullptr);
    REQUIRE_FALSE(no_process.has_value());
    REQUIRE_THAT(no_process.error().message, ContainsSubstring("spawned process"));
}

TEST_CASE("Stdio build takes the process pipes", "[factory]") {
    TransportFactory factory(mock_factory(std::make_shared<MockHttpClient>()));

    ConnectionConfig config;
    config.command = "server";
    SpawnedProcess process;

    auto transport = factory.build(config, &process);
    REQUIRE(transport.has_value());
    REQUIRE((*transport)->kind() == TransportKind::Stdio);
}

TEST_CASE("Network builds require a URL", "[factory]") {
    TransportFactory factory(mock_factory(std::make_shared<MockHttpClient>()));

    for (auto kind : {TransportKind::EventStream, TransportKind::Http}) {
        ConnectionConfig config;
        config.transport = kind;
        auto transport = factory.build(config, nullptr);
        REQUIRE_FALSE(transport.has_value());
        REQUIRE_THAT(transport.error().message, ContainsSubstring("URL"));
    }
}

TEST_CASE("Network builds use the injected HTTP client", "[factory]") {
    auto http = std::make_shared<MockHttpClient>();
    TransportFactory factory(mock_factory(http));

    ConnectionConfig config;
    config.transport = TransportKind::Http;
    config.url = "http://localhost:3000/mcp";
    config.headers = {{"X-Api-Key", "k"}};
    config.timeout = 4s;

    auto transport = factory.build(config, nullptr);
    REQUIRE(transport.has_value());
    REQUIRE((*transport)->kind() == TransportKind::Http);
    REQUIRE((*transport)->start(4s).has_value());
    REQUIRE(http->default_headers().at("X-Api-Key") == "k");
    REQUIRE(http->connect_timeout() == 4s);

    config.transport = TransportKind::EventStream;
    auto stream = factory.build(config, nullptr);
    REQUIRE(stream.has_value());
    REQUIRE((*stream)->kind() == TransportKind::EventStream);
}

TEST_CASE("Missing HTTP client is a transport error", "[factory]") {
    TransportFactory factory([] { return std::shared_ptr<IHttpClient>{}; });

    ConnectionConfig config;
    config.transport = TransportKind::Http;
    config.url = "http://localhost:3000/mcp";

    auto transport = factory.build(config, nullptr);
    REQUIRE_FALSE(transport.has_value());
    REQUIRE(transport.error().category == ErrorCategory::Transport);
}
