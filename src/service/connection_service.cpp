#include "mcpc/service/connection_service.hpp"

#include "mcpc/debug/instrumented_transport.hpp"
#include "mcpc/log/logger.hpp"
#include "mcpc/protocol/json_rpc.hpp"
#include "mcpc/service/early_output_buffer.hpp"
#include "mcpc/service/tool_arguments.hpp"

#include <format>
#include <unordered_map>

namespace mcpc {

bool is_valid_transition(ConnectionState from, ConnectionState to) noexcept {
    switch (from) {
        case ConnectionState::Idle:
            return to == ConnectionState::Connecting;
        case ConnectionState::Connecting:
            return to == ConnectionState::Connected || to == ConnectionState::Failed ||
                   to == ConnectionState::Idle;
        case ConnectionState::Connected:
            return to == ConnectionState::Disconnecting;
        case ConnectionState::Disconnecting:
            return to == ConnectionState::Idle;
        case ConnectionState::Failed:
            return to == ConnectionState::Connecting || to == ConnectionState::Idle;
    }
    return false;
}

/// Everything that belongs to one connection attempt.
struct ConnectionService::Session {
    explicit Session(ConnectionConfig cfg, std::size_t early_output_limit)
        : config(std::move(cfg))
        , early_output(std::make_shared<EarlyOutputBuffer>(early_output_limit))
    {}

    const ConnectionConfig config;
    std::optional<ProcessId> process;
    std::atomic<std::int64_t> pid{-1};

    // Published under transport_mutex so a cancelling disconnect can close it.
    std::mutex transport_mutex;
    std::unique_ptr<Transport> transport;
    std::atomic<bool> cancelled{false};

    std::shared_ptr<EarlyOutputBuffer> early_output;
    std::atomic<bool> protocol_seen{false};
    std::once_flag teardown_once;
    std::atomic<std::int64_t> next_id{1};

    // Written once, before the session is published as Connected.
    Json server_info;
    std::chrono::system_clock::time_point connected_since;

    std::mutex schema_mutex;
    std::unordered_map<std::string, Json> tool_schemas;
};

ConnectionService::ConnectionService(ProcessSupervisor& supervisor,
                                     const CommandValidator& validator,
                                     const TransportFactory& factory,
                                     std::shared_ptr<ProtocolLog> protocol_log,
                                     ServiceConfig config)
    : supervisor_(supervisor)
    , validator_(validator)
    , factory_(factory)
    , protocol_log_(std::move(protocol_log))
    , config_(config)
{}

ConnectionService::~ConnectionService() {
    disconnect();
}

// ─────────────────────────────────────────────────────────────────────────────
// Connect / Disconnect
// ─────────────────────────────────────────────────────────────────────────────

Status ConnectionService::connect(const ConnectionConfig& config) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(mutex_);
        if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Disconnecting) {
            return tl::unexpected(Error::protocol(
                std::format("Cannot connect while {}", to_string(state_))));
        }
        if (state_ == ConnectionState::Connected) {
            return tl::unexpected(Error::protocol("Already connected; disconnect first"));
        }
        set_state(ConnectionState::Connecting);
        session = std::make_shared<Session>(config, config_.early_output_limit);
        session_ = session;
        cancel_requested_ = false;
    }

    get_logger().info_fmt("Connecting via {}", to_string(config.transport));
    auto established = establish(*session);

    if (established.has_value()) {
        std::lock_guard lock(mutex_);
        if (cancel_requested_ == false) {
            session->connected_since = std::chrono::system_clock::now();
            set_state(ConnectionState::Connected);
            MCPC_LOG_INFO("Connected");
            return {};
        }
        established = tl::unexpected(Error::transport("Connection cancelled"));
    }

    teardown(*session);
    record_error("connect", established.error());

    std::lock_guard lock(mutex_);
    session_.reset();
    set_state(cancel_requested_ ? ConnectionState::Idle : ConnectionState::Failed);
    return established;
}

void ConnectionService::disconnect() {
    std::shared_ptr<Session> session;
    bool cancelling = false;
    {
        std::lock_guard lock(mutex_);
        switch (state_) {
            case ConnectionState::Idle:
                return;
            case ConnectionState::Failed:
                set_state(ConnectionState::Idle);
                return;
            case ConnectionState::Connecting:
                // connect() still owns teardown; closing the transport only
                // unblocks it.
                cancel_requested_ = true;
                cancelling = true;
                session = session_;
                break;
            case ConnectionState::Connected:
                set_state(ConnectionState::Disconnecting);
                session = session_;
                break;
            case ConnectionState::Disconnecting:
                session = session_;
                break;
        }
    }

    if (cancelling) {
        if (session) {
            cancel_attempt(*session);
        }
        return;
    }

    if (session) {
        teardown(*session);
    }

    std::lock_guard lock(mutex_);
    if (state_ == ConnectionState::Disconnecting && session_ == session) {
        session_.reset();
        set_state(ConnectionState::Idle);
        MCPC_LOG_INFO("Disconnected");
    }
}

ConnectionState ConnectionService::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool ConnectionService::is_connected() const {
    return state() == ConnectionState::Connected;
}

Status ConnectionService::establish(Session& session) {
    const auto& config = session.config;
    const auto strategy = context_strategy(config.transport, config.timeout);

    SpawnedProcess spawned;
    SpawnedProcess* process = nullptr;

    if (config.transport == TransportKind::Stdio) {
        auto validated = validator_.validate(config.command, config.args);
        if (validated.has_value() == false) {
            return tl::unexpected(std::move(validated.error()));
        }

        SpawnOptions options;
        options.env = config.env;
        options.working_directory = config.working_directory;
        auto result = supervisor_.spawn(*validated, options);
        if (result.has_value() == false) {
            return tl::unexpected(std::move(result.error()));
        }
        spawned = std::move(*result);
        session.process = spawned.id;
        session.pid = spawned.pid;
        process = &spawned;
    }

    auto early_output = session.early_output;
    auto built = factory_.build(config, process, [early_output](std::string_view text) {
        early_output->append(text);
    });
    if (built.has_value() == false) {
        return tl::unexpected(std::move(built.error()));
    }

    auto transport = std::make_unique<InstrumentedTransport>(std::move(*built), protocol_log_);
    transport->set_notification_handler([this, &session](const Json& notification) {
        session.protocol_seen = true;
        dispatch_notification(notification);
    });
    {
        std::lock_guard lock(session.transport_mutex);
        if (session.cancelled.load()) {
            return tl::unexpected(Error::transport("Connection cancelled"));
        }
        session.transport = std::move(transport);
    }

    auto outcome = session.transport->start(strategy.connect_timeout)
        .and_then([&]() { return handshake(session, strategy.request_timeout); });

    if (outcome.has_value() == false) {
        if (session.cancelled.load()) {
            return tl::unexpected(Error::transport("Connection cancelled"));
        }
        if (config.transport == TransportKind::Stdio) {
            return tl::unexpected(explain_stdio_failure(session, std::move(outcome.error())));
        }
        return tl::unexpected(std::move(outcome.error()));
    }

    session.early_output->seal();
    session.server_info = std::move(*outcome);
    return {};
}

Result<Json> ConnectionService::handshake(Session& session, std::chrono::milliseconds timeout) {
    const auto& config = session.config;
    Json params = {
        {"protocolVersion", std::string(kMcpProtocolVersion)},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", config.client_name}, {"version", config.client_version}}},
    };

    auto result = request(session, "initialize", std::move(params), timeout);
    if (result.has_value() == false) {
        return result;
    }
    if (result->is_object() == false) {
        return tl::unexpected(Error::protocol("initialize returned a non-object result")
                                  .with_evidence(excerpt(result->dump())));
    }

    if (auto sent = session.transport->send_notification(make_notification("notifications/initialized"));
        sent.has_value() == false) {
        return tl::unexpected(std::move(sent.error()));
    }

    if (result->contains("serverInfo")) {
        get_logger().info_fmt("Server: {}", (*result)["serverInfo"].dump());
    }
    return result;
}

Error ConnectionService::explain_stdio_failure(Session& session, Error failure) {
    // A server that answered with JSON-RPC got past startup.
    if (session.protocol_seen.load() || failure.rpc_code.has_value()) {
        return failure;
    }

    std::optional<int> exit_code;
    if (session.process.has_value()) {
        exit_code = supervisor_.wait_for_exit(*session.process, config_.exit_settle_window);
    }
    // Closing collects whatever the readers had not delivered yet.
    session.transport->close();

    const auto output = session.early_output->text();
    const auto classification = classifier_.classify(exit_code, output);
    if (classification.matched()) {
        auto error = StartupErrorClassifier::to_error(classification, session.config.command);
        get_logger().warn_fmt("{}", error.message);
        return error;
    }

    auto error = Error::protocol(std::format("Handshake with '{}' failed: {}",
                                             session.config.command, failure.message));
    if (output.empty() == false) {
        error.evidence = excerpt(output);
    } else if (failure.evidence.has_value()) {
        error.evidence = failure.evidence;
    }
    if (exit_code.has_value()) {
        error.remediation = std::format("The server exited with status {} before completing the handshake; "
                                        "check that the command starts an MCP server on stdio",
                                        *exit_code);
    } else {
        error.remediation = "Check that the command starts an MCP server speaking JSON-RPC on stdio";
    }
    return error;
}

void ConnectionService::cancel_attempt(Session& session) {
    std::lock_guard lock(session.transport_mutex);
    session.cancelled = true;
    if (session.transport) {
        MCPC_LOG_INFO("Cancelling connection attempt");
        // Fails the in-flight handshake request.
        session.transport->close();
    }
}

void ConnectionService::teardown(Session& session) {
    std::call_once(session.teardown_once, [this, &session] {
        if (session.transport) {
            session.transport->close();
        }
        if (session.process.has_value()) {
            const auto result = supervisor_.terminate(*session.process);
            if (result.outcome == TerminateOutcome::GaveUp) {
                get_logger().warn_fmt("Server process {} did not exit; left to the reaper", session.pid.load());
            } else {
                get_logger().debug_fmt("Server process {} stopped (forced: {})", session.pid.load(), result.forced);
            }
        }
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// Operations
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<ConnectionService::Session> ConnectionService::connected_session() const {
    std::lock_guard lock(mutex_);
    if (state_ != ConnectionState::Connected) {
        return nullptr;
    }
    return session_;
}

Result<Json> ConnectionService::request(Session& session,
                                        std::string_view method,
                                        std::optional<Json> params,
                                        std::chrono::milliseconds timeout) {
    const auto id = session.next_id.fetch_add(1);
    auto response = session.transport->send_request(make_request(id, method, std::move(params)), timeout);
    if (response.has_value() == false) {
        return tl::unexpected(std::move(response.error()));
    }
    session.protocol_seen = true;
    return extract_result(*response);
}

Result<Json> ConnectionService::invoke(std::string_view operation,
                                       std::string_view method,
                                       std::optional<Json> params) {
    auto session = connected_session();
    if (session == nullptr) {
        auto error = Error::not_connected();
        record_error(operation, error);
        return tl::unexpected(std::move(error));
    }

    ++requests_sent_;
    auto result = request(*session, method, std::move(params), session->config.timeout);
    if (result.has_value() == false) {
        ++requests_failed_;
        record_error(operation, result.error());
    }
    return result;
}

Result<Json> ConnectionService::list_page(std::string_view operation,
                                          std::string_view method,
                                          std::string_view key,
                                          const std::optional<std::string>& cursor) {
    std::optional<Json> params;
    if (cursor.has_value()) {
        params = Json{{"cursor", *cursor}};
    }

    auto result = invoke(operation, method, std::move(params));
    if (result.has_value() == false) {
        return result;
    }

    const auto it = result->find(std::string(key));
    if (result->is_object() == false || it == result->end() || it->is_array() == false) {
        auto error = Error::protocol(std::format("{} result has no '{}' array", method, key))
                         .with_evidence(excerpt(result->dump()));
        record_error(operation, error);
        return tl::unexpected(std::move(error));
    }
    return result;
}

Result<Json> ConnectionService::list_tools(std::optional<std::string> cursor) {
    auto result = list_page("list_tools", "tools/list", "tools", cursor);
    if (result.has_value() == false) {
        return result;
    }

    if (auto session = connected_session(); session != nullptr) {
        std::lock_guard lock(session->schema_mutex);
        for (const auto& tool : (*result)["tools"]) {
            if (tool.is_object() && tool.contains("name") && tool["name"].is_string()) {
                session->tool_schemas[tool["name"].get<std::string>()] =
                    tool.value("inputSchema", Json::object());
            }
        }
    }
    return result;
}

Result<Json> ConnectionService::call_tool(const std::string& name, Json arguments) {
    if (auto session = connected_session(); session != nullptr) {
        std::lock_guard lock(session->schema_mutex);
        if (const auto it = session->tool_schemas.find(name); it != session->tool_schemas.end()) {
            arguments = shape_tool_arguments(it->second, std::move(arguments));
        }
    }
    return invoke("call_tool", "tools/call", Json{{"name", name}, {"arguments", std::move(arguments)}});
}

Result<Json> ConnectionService::list_resources(std::optional<std::string> cursor) {
    return list_page("list_resources", "resources/list", "resources", cursor);
}

Result<Json> ConnectionService::read_resource(const std::string& uri) {
    return invoke("read_resource", "resources/read", Json{{"uri", uri}});
}

Result<Json> ConnectionService::list_prompts(std::optional<std::string> cursor) {
    return list_page("list_prompts", "prompts/list", "prompts", cursor);
}

Result<Json> ConnectionService::get_prompt(const std::string& name, Json arguments) {
    // Prompt arguments are string-valued.
    Json string_arguments = Json::object();
    if (arguments.is_object()) {
        for (const auto& [key, value] : arguments.items()) {
            string_arguments[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return invoke("get_prompt", "prompts/get",
                  Json{{"name", name}, {"arguments", std::move(string_arguments)}});
}

Status ConnectionService::ping() {
    auto result = invoke("ping", "ping", std::nullopt);
    if (result.has_value() == false) {
        return tl::unexpected(std::move(result.error()));
    }
    return {};
}

std::optional<Json> ConnectionService::server_info() const {
    auto session = connected_session();
    if (session == nullptr) {
        return std::nullopt;
    }
    return session->server_info;
}

void ConnectionService::on_notification(NotificationHandler handler) {
    std::lock_guard lock(notification_mutex_);
    notification_handler_ = std::move(handler);
}

// ─────────────────────────────────────────────────────────────────────────────
// Health and statistics
// ─────────────────────────────────────────────────────────────────────────────

ConnectionHealth ConnectionService::health() const {
    ConnectionHealth health;
    {
        std::lock_guard lock(mutex_);
        health.state = state_;
        health.connected = state_ == ConnectionState::Connected;
        if (session_) {
            health.transport = session_->config.transport;
            if (const auto pid = session_->pid.load(); pid >= 0) {
                health.server_pid = pid;
            }
            if (health.connected) {
                health.connected_since = session_->connected_since;
            }
        }
    }
    health.requests_sent = requests_sent_.load();
    health.requests_failed = requests_failed_.load();
    health.notifications_received = notifications_received_.load();
    {
        std::lock_guard lock(stats_mutex_);
        if (stats_.last.has_value()) {
            health.last_error = stats_.last->error;
        }
    }
    return health;
}

ErrorStatistics ConnectionService::error_statistics() const {
    std::lock_guard lock(stats_mutex_);
    ErrorStatistics copy = stats_;
    copy.history.assign(history_.begin(), history_.end());
    return copy;
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionService::set_state(ConnectionState next) {
    // Caller holds mutex_.
    if (is_valid_transition(state_, next) == false) {
        get_logger().error_fmt("Invalid connection state transition {} -> {}",
                               to_string(state_), to_string(next));
        return;
    }
    get_logger().debug_fmt("Connection state {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

void ConnectionService::dispatch_notification(const Json& notification) {
    ++notifications_received_;
    NotificationHandler handler;
    {
        std::lock_guard lock(notification_mutex_);
        handler = notification_handler_;
    }
    if (handler) {
        handler(notification);
    }
}

void ConnectionService::record_error(std::string_view operation, const Error& error) {
    get_logger().warn_fmt("{} failed: {}", operation, error.describe());

    ErrorRecord record{std::chrono::system_clock::now(), std::string(operation), error};

    std::lock_guard lock(stats_mutex_);
    ++stats_.total;
    ++stats_.by_category[static_cast<std::size_t>(error.category)];
    if (error.category == ErrorCategory::StartupFailure) {
        ++stats_.by_startup_category[static_cast<std::size_t>(error.startup)];
    }
    stats_.last = record;
    history_.push_back(std::move(record));
    while (history_.size() > config_.error_history) {
        history_.pop_front();
    }
}

}  // namespace mcpc
