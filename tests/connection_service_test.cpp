// ─────────────────────────────────────────────────────────────────────────────
// ConnectionService Tests
// ─────────────────────────────────────────────────────────────────────────────
// Network cases run against MockHttpClient; stdio cases spawn real processes.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpc/service/connection_service.hpp"
#include "mocks/mock_http_client.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace mcpc;
using namespace mcpc::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr const char* kInitializeResult =
    R"({"jsonrpc":"2.0","id":1,"result":{"protocolVersion":"2024-11-05","capabilities":{"tools":{}},)"
    R"("serverInfo":{"name":"demo","version":"1.0.0"}}})";

SupervisorConfig fast_supervisor() {
    SupervisorConfig config;
    config.grace_window = 500ms;
    config.force_window = 500ms;
    config.reap_interval = 20ms;
    config.poll_interval = 5ms;
    return config;
}

/// Wires a service the way the CLI does, with an injectable HTTP client.
struct Fixture {
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    ProcessSupervisor supervisor{fast_supervisor()};
    CommandValidator validator;
    TransportFactory factory{[this] { return std::shared_ptr<IHttpClient>(http); }};
    std::shared_ptr<ProtocolLog> log = std::make_shared<ProtocolLog>(200);
    ConnectionService service{supervisor, validator, factory, log};

    static ConnectionConfig http_config() {
        ConnectionConfig config;
        config.transport = TransportKind::Http;
        config.url = "http://localhost:3000/mcp";
        config.timeout = 2s;
        return config;
    }

    void connect_http() {
        http->queue_response_with_session(200, kInitializeResult, "session-1");
        REQUIRE(service.connect(http_config()).has_value());
    }

    std::size_t count_events(std::string_view payload) const {
        std::size_t n = 0;
        for (const auto& entry : log->snapshot()) {
            n += (entry.kind == MessageKind::TransportEvent && entry.payload == payload) ? 1 : 0;
        }
        return n;
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// State machine
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Connection state transitions", "[service][state]") {
    REQUIRE(is_valid_transition(ConnectionState::Idle, ConnectionState::Connecting));
    REQUIRE(is_valid_transition(ConnectionState::Connecting, ConnectionState::Connected));
    REQUIRE(is_valid_transition(ConnectionState::Connecting, ConnectionState::Failed));
    REQUIRE(is_valid_transition(ConnectionState::Connected, ConnectionState::Disconnecting));
    REQUIRE(is_valid_transition(ConnectionState::Disconnecting, ConnectionState::Idle));
    REQUIRE(is_valid_transition(ConnectionState::Failed, ConnectionState::Connecting));

    REQUIRE_FALSE(is_valid_transition(ConnectionState::Idle, ConnectionState::Connected));
    REQUIRE_FALSE(is_valid_transition(ConnectionState::Connected, ConnectionState::Connecting));
    REQUIRE_FALSE(is_valid_transition(ConnectionState::Disconnecting, ConnectionState::Connected));
}

TEST_CASE("Operations before connect fail with NotConnected", "[service]") {
    Fixture f;

    auto tools = f.service.list_tools();
    REQUIRE_FALSE(tools.has_value());
    REQUIRE(tools.error().category == ErrorCategory::NotConnected);
    REQUIRE(f.service.ping().error().category == ErrorCategory::NotConnected);
    REQUIRE_FALSE(f.service.server_info().has_value());

    auto stats = f.service.error_statistics();
    REQUIRE(stats.total == 2);
    REQUIRE(stats.count(ErrorCategory::NotConnected) == 2);
    REQUIRE(stats.last->operation == "ping");
    REQUIRE(f.http->requests().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// HTTP connections
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Connect performs the initialize handshake", "[service][http]") {
    Fixture f;
    f.connect_http();

    REQUIRE(f.service.state() == ConnectionState::Connected);
    REQUIRE(f.service.server_info().value()["serverInfo"]["name"] == "demo");

    auto requests = f.http->requests();
    REQUIRE(requests.size() == 2);
    auto initialize = Json::parse(requests[0].body);
    REQUIRE(initialize["method"] == "initialize");
    REQUIRE(initialize["params"]["protocolVersion"] == "2024-11-05");
    REQUIRE(initialize["params"]["clientInfo"]["name"] == "mcpc");
    auto initialized = Json::parse(requests[1].body);
    REQUIRE(initialized["method"] == "notifications/initialized");
    REQUIRE(initialized.contains("id") == false);

    auto health = f.service.health();
    REQUIRE(health.connected);
    REQUIRE(health.transport == TransportKind::Http);
    REQUIRE_FALSE(health.server_pid.has_value());
    REQUIRE(health.connected_since.has_value());
}

TEST_CASE("Second connect is rejected while connected", "[service][http]") {
    Fixture f;
    f.connect_http();

    auto again = f.service.connect(Fixture::http_config());
    REQUIRE_FALSE(again.has_value());
    REQUIRE_THAT(again.error().message, ContainsSubstring("Already connected"));
    REQUIRE(f.service.state() == ConnectionState::Connected);
}

TEST_CASE("Operations return results unchanged", "[service][http]") {
    Fixture f;
    f.connect_http();

    f.http->queue_json_response(200,
        R"({"jsonrpc":"2.0","id":2,"result":{"resources":[{"uri":"file:///a","name":"a"}],"nextCursor":"p2"}})");
    auto resources = f.service.list_resources();
    REQUIRE(resources.has_value());
    REQUIRE((*resources)["nextCursor"] == "p2");

    f.http->queue_json_response(200, R"({"jsonrpc":"2.0","id":3,"result":{"prompts":[]}})");
    auto prompts = f.service.list_prompts(std::string("p2"));
    REQUIRE(prompts.has_value());
    REQUIRE(Json::parse(f.http->last_request()->body)["params"]["cursor"] == "p2");

    f.http->queue_json_response(200,
        R"({"jsonrpc":"2.0","id":4,"result":{"contents":[{"uri":"file:///a","text":"hi"}]}})");
    auto read = f.service.read_resource("file:///a");
    REQUIRE(read.has_value());
    REQUIRE((*read)["contents"][0]["text"] == "hi");

    f.http->queue_json_response(200, R"({"jsonrpc":"2.0","id":5,"result":{"messages":[]}})");
    auto prompt = f.service.get_prompt("greet", Json{{"name", "Ada"}, {"times", 2}});
    REQUIRE(prompt.has_value());
    auto sent = Json::parse(f.http->last_request()->body);
    REQUIRE(sent["params"]["arguments"]["times"] == "2");

    f.http->queue_json_response(200, R"({"jsonrpc":"2.0","id":6,"result":{}})");
    REQUIRE(f.service.ping().has_value());

    REQUIRE(f.service.health().requests_sent == 5);
    REQUIRE(f.service.health().requests_failed == 0);
}

TEST_CASE("call_tool shapes empty arrays against the cached schema", "[service][http][tools]") {
    Fixture f;
    f.connect_http();

    f.http->queue_json_response(200, R"({"jsonrpc":"2.0","id":2,"result":{"tools":[
        {"name":"search","inputSchema":{"type":"object",
            "properties":{"paths":{"type":"array"},"tags":{"type":"array"},"q":{"type":"string"}},
            "required":["paths","q"]}}]}})");
    REQUIRE(f.service.list_tools().has_value());

    f.http->queue_json_response(200,
        R"({"jsonrpc":"2.0","id":3,"result":{"content":[{"type":"text","text":"none"}],"isError":false}})");
    auto result = f.service.call_tool("search", Json{{"paths", Json::array()}, {"tags", Json::array()}, {"q", "x"}});
    REQUIRE(result.has_value());
    REQUIRE((*result)["content"][0]["text"] == "none");

    auto sent = Json::parse(f.http->last_request()->body);
    REQUIRE(sent["method"] == "tools/call");
    REQUIRE(sent["params"]["name"] == "search");
    REQUIRE(sent["params"]["arguments"]["paths"] == Json::array());
    REQUIRE(sent["params"]["arguments"].contains("tags") == false);
}

TEST_CASE("Server errors are recorded and returned", "[service][http]") {
    Fixture f;
    f.connect_http();

    f.http->queue_json_response(200,
        R"({"jsonrpc":"2.0","id":2,"error":{"code":-32602,"message":"Unknown tool: nope"}})");
    auto result = f.service.call_tool("nope");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().rpc_code == -32602);

    f.http->queue_json_response(200, R"({"jsonrpc":"2.0","id":3,"result":{"items":[]}})");
    auto tools = f.service.list_tools();
    REQUIRE_FALSE(tools.has_value());
    REQUIRE_THAT(tools.error().message, ContainsSubstring("'tools'"));

    auto stats = f.service.error_statistics();
    REQUIRE(stats.count(ErrorCategory::Protocol) == 2);
    REQUIRE(stats.history.size() == 2);
    REQUIRE(stats.history[0].operation == "call_tool");
    REQUIRE(f.service.health().requests_failed == 1);
    REQUIRE(f.service.health().last_error.has_value());
}

TEST_CASE("Failed handshake leaves the service Failed", "[service][http]") {
    Fixture f;
    f.http->queue_response(503, "Service Unavailable");

    auto connected = f.service.connect(Fixture::http_config());
    REQUIRE_FALSE(connected.has_value());
    REQUIRE(connected.error().category == ErrorCategory::Transport);
    REQUIRE(f.service.state() == ConnectionState::Failed);

    // Failed allows a fresh attempt.
    f.connect_http();
    REQUIRE(f.service.state() == ConnectionState::Connected);
}

TEST_CASE("Disconnect from Failed returns to Idle", "[service][http]") {
    Fixture f;
    f.http->queue_connection_error();
    REQUIRE_FALSE(f.service.connect(Fixture::http_config()).has_value());

    f.service.disconnect();
    REQUIRE(f.service.state() == ConnectionState::Idle);
}

TEST_CASE("Concurrent disconnects tear down once", "[service][http][concurrency]") {
    Fixture f;
    f.connect_http();

    std::thread a([&] { f.service.disconnect(); });
    std::thread b([&] { f.service.disconnect(); });
    a.join();
    b.join();
    f.service.disconnect();

    REQUIRE(f.service.state() == ConnectionState::Idle);
    REQUIRE(f.count_events("close http") == 1);
    REQUIRE(f.http->count(HttpMethod::Delete) == 1);

    REQUIRE(f.service.ping().error().category == ErrorCategory::NotConnected);
}

TEST_CASE("Notifications reach the registered handler", "[service][http]") {
    Fixture f;
    std::atomic<int> seen{0};
    f.service.on_notification([&](const Json&) { ++seen; });
    f.connect_http();

    f.http->queue_sse_response(
        "event: message\ndata: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{}}\n\n"
        "event: message\ndata: {\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{}}\n\n");
    REQUIRE(f.service.ping().has_value());

    REQUIRE(seen == 1);
    REQUIRE(f.service.health().notifications_received == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Event-stream connections
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Disconnect during connect cancels the attempt", "[service][event_stream]") {
    Fixture f;  // the stream never announces an endpoint

    ConnectionConfig config;
    config.transport = TransportKind::EventStream;
    config.url = "http://localhost:3000/sse";
    config.timeout = 500ms;

    Status connected;
    std::thread connector([&] { connected = f.service.connect(config); });

    for (int i = 0; i < 100 && f.service.state() != ConnectionState::Connecting; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    f.service.disconnect();
    connector.join();

    REQUIRE_FALSE(connected.has_value());
    REQUIRE(f.service.state() == ConnectionState::Idle);
    REQUIRE_FALSE(f.http->stream_active());
}

// ═══════════════════════════════════════════════════════════════════════════
// Stdio connections
// ═══════════════════════════════════════════════════════════════════════════

#ifndef _WIN32

TEST_CASE("Injection attempts never reach the supervisor", "[service][stdio]") {
    Fixture f;

    ConnectionConfig config;
    config.command = "ls;rm -rf /";

    auto connected = f.service.connect(config);
    REQUIRE_FALSE(connected.has_value());
    REQUIRE(connected.error().category == ErrorCategory::Validation);
    REQUIRE(f.supervisor.tracked_count() == 0);
    REQUIRE(f.service.state() == ConnectionState::Failed);
}

TEST_CASE("Missing executables are spawn errors", "[service][stdio]") {
    Fixture f;

    ConnectionConfig config;
    config.command = "/nonexistent/server";

    auto connected = f.service.connect(config);
    REQUIRE_FALSE(connected.has_value());
    REQUIRE(connected.error().category == ErrorCategory::ProcessSpawn);
}

TEST_CASE("A server complaining about its environment is a startup failure", "[service][stdio]") {
    Fixture f;

    ConnectionConfig config;
    config.command = "/bin/sh";
    config.args = {"-c", "echo 'Error: X environment variable is required' >&2"};
    config.timeout = 5s;

    auto connected = f.service.connect(config);
    REQUIRE_FALSE(connected.has_value());
    REQUIRE(connected.error().category == ErrorCategory::StartupFailure);
    REQUIRE(connected.error().startup == StartupCategory::MissingEnvVar);
    REQUIRE_THAT(connected.error().message, ContainsSubstring("X"));
    REQUIRE_THAT(connected.error().remediation.value(), ContainsSubstring("X environment variable"));
    REQUIRE(f.supervisor.tracked_count() == 0);

    auto stats = f.service.error_statistics();
    REQUIRE(stats.count(StartupCategory::MissingEnvVar) == 1);
}

TEST_CASE("A program that is not an MCP server is a protocol error", "[service][stdio]") {
    Fixture f;

    ConnectionConfig config;
    config.command = "/bin/ls";
    config.working_directory = "/";
    config.timeout = 5s;

    auto connected = f.service.connect(config);
    REQUIRE_FALSE(connected.has_value());
    REQUIRE(connected.error().category == ErrorCategory::Protocol);
    REQUIRE(connected.error().evidence.has_value());
    REQUIRE(connected.error().remediation.has_value());
    REQUIRE(f.supervisor.tracked_count() == 0);
}

TEST_CASE("Disconnect interrupts a stdio handshake that never answers", "[service][stdio][concurrency]") {
    Fixture f;

    ConnectionConfig config;
    config.command = "/bin/sleep";
    config.args = {"30"};
    config.timeout = 10s;

    Status connected;
    std::thread connector([&] { connected = f.service.connect(config); });

    for (int i = 0; i < 200 && f.service.state() != ConnectionState::Connecting; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    std::this_thread::sleep_for(100ms);

    const auto cancelled_at = std::chrono::steady_clock::now();
    f.service.disconnect();
    connector.join();
    const auto elapsed = std::chrono::steady_clock::now() - cancelled_at;

    REQUIRE(elapsed < 1s);
    REQUIRE_FALSE(connected.has_value());
    REQUIRE_THAT(connected.error().message, ContainsSubstring("cancelled"));
    REQUIRE(f.service.state() == ConnectionState::Idle);
    REQUIRE(f.supervisor.tracked_count() == 0);
    REQUIRE(f.count_events("close stdio") == 1);
}

TEST_CASE("Stdio servers complete the handshake and are stopped on disconnect", "[service][stdio]") {
    // Answers initialize, swallows notifications/initialized, then answers ping (id 2).
    const auto script = std::filesystem::temp_directory_path() / "mcpc_service_server.sh";
    {
        std::ofstream out(script);
        out << "read a\n"
               "echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"serverInfo\":{\"name\":\"sh\"}}}'\n"
               "read b\n"
               "read c\n"
               "echo '{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{}}'\n"
               "sleep 30\n";
    }

    Fixture f;
    ConnectionConfig config;
    config.command = "/bin/sh";
    config.args = {script.string()};
    config.timeout = 5s;

    REQUIRE(f.service.connect(config).has_value());
    REQUIRE(f.service.server_info().value()["serverInfo"]["name"] == "sh");
    REQUIRE(f.service.ping().has_value());

    auto health = f.service.health();
    REQUIRE(health.transport == TransportKind::Stdio);
    REQUIRE(health.server_pid.has_value());
    REQUIRE(f.supervisor.tracked_count() == 1);

    f.service.disconnect();
    REQUIRE(f.service.state() == ConnectionState::Idle);
    REQUIRE(f.supervisor.tracked_count() == 0);
    REQUIRE(f.count_events("close stdio") == 1);

    std::filesystem::remove(script);
}

#endif
