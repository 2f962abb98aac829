#pragma once

#include "mcpc/connection_config.hpp"
#include "mcpc/debug/protocol_log.hpp"
#include "mcpc/diagnostics/startup_error_classifier.hpp"
#include "mcpc/error.hpp"
#include "mcpc/json/json.hpp"
#include "mcpc/process/process_supervisor.hpp"
#include "mcpc/security/command_validator.hpp"
#include "mcpc/transport/transport_factory.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpc {

/// MCP revision sent in initialize.
inline constexpr std::string_view kMcpProtocolVersion{"2024-11-05"};

enum class ConnectionState {
    Idle,
    Connecting,
    Connected,
    Disconnecting,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Idle:          return "idle";
        case ConnectionState::Connecting:    return "connecting";
        case ConnectionState::Connected:     return "connected";
        case ConnectionState::Disconnecting: return "disconnecting";
        case ConnectionState::Failed:        return "failed";
    }
    return "unknown";
}

/// Idle -> Connecting -> Connected | Failed | Idle (cancelled);
/// Connected -> Disconnecting -> Idle; Failed -> Connecting | Idle.
[[nodiscard]] bool is_valid_transition(ConnectionState from, ConnectionState to) noexcept;

struct ServiceConfig {
    std::size_t early_output_limit{64 * 1024};
    std::chrono::milliseconds exit_settle_window{500};  ///< Wait for a failed server to exit
    std::size_t error_history{50};
};

struct ErrorRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string operation;
    Error error;
};

struct ErrorStatistics {
    std::uint64_t total{0};
    std::array<std::uint64_t, kErrorCategoryCount> by_category{};
    std::array<std::uint64_t, kStartupCategoryCount> by_startup_category{};
    std::optional<ErrorRecord> last;
    std::vector<ErrorRecord> history;  ///< Oldest first

    [[nodiscard]] std::uint64_t count(ErrorCategory category) const noexcept {
        return by_category[static_cast<std::size_t>(category)];
    }
    [[nodiscard]] std::uint64_t count(StartupCategory category) const noexcept {
        return by_startup_category[static_cast<std::size_t>(category)];
    }
};

struct ConnectionHealth {
    ConnectionState state{ConnectionState::Idle};
    bool connected{false};
    std::optional<TransportKind> transport;
    std::optional<std::int64_t> server_pid;
    std::optional<std::chrono::system_clock::time_point> connected_since;
    std::uint64_t requests_sent{0};
    std::uint64_t requests_failed{0};
    std::uint64_t notifications_received{0};
    std::optional<Error> last_error;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionService
// ─────────────────────────────────────────────────────────────────────────────
// Owns at most one connection to one MCP server.
//
//   connect():  validate -> spawn (stdio) -> build transport -> instrument
//               -> start -> initialize handshake
//   disconnect(): close transport, terminate process; runs once per connection
//               no matter how many callers race on it
//
// Operations other than connect()/disconnect() require the Connected state and
// otherwise fail with NotConnected. All methods are safe to call from any
// thread; requests may run concurrently.

class ConnectionService {
public:
    ConnectionService(ProcessSupervisor& supervisor,
                      const CommandValidator& validator,
                      const TransportFactory& factory,
                      std::shared_ptr<ProtocolLog> protocol_log,
                      ServiceConfig config = {});
    ~ConnectionService();

    ConnectionService(const ConnectionService&) = delete;
    ConnectionService& operator=(const ConnectionService&) = delete;
    ConnectionService(ConnectionService&&) = delete;
    ConnectionService& operator=(ConnectionService&&) = delete;

    /// Blocks until the handshake completes or fails. Rejected while another
    /// connect is in flight or a connection is open.
    [[nodiscard]] Status connect(const ConnectionConfig& config);

    /// Safe to call any number of times from any thread. An in-flight connect
    /// is cancelled: its transport is closed so the handshake fails at once,
    /// and connect() terminates the server before it returns. A Failed state
    /// goes back to Idle.
    void disconnect();

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] bool is_connected() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────
    // Each returns the JSON-RPC `result` object unchanged.

    [[nodiscard]] Result<Json> list_tools(std::optional<std::string> cursor = std::nullopt);
    [[nodiscard]] Result<Json> call_tool(const std::string& name, Json arguments = Json::object());
    [[nodiscard]] Result<Json> list_resources(std::optional<std::string> cursor = std::nullopt);
    [[nodiscard]] Result<Json> read_resource(const std::string& uri);
    [[nodiscard]] Result<Json> list_prompts(std::optional<std::string> cursor = std::nullopt);
    [[nodiscard]] Result<Json> get_prompt(const std::string& name, Json arguments = Json::object());
    [[nodiscard]] Status ping();

    /// initialize result of the current connection.
    [[nodiscard]] std::optional<Json> server_info() const;

    void on_notification(NotificationHandler handler);

    [[nodiscard]] ConnectionHealth health() const;
    [[nodiscard]] ErrorStatistics error_statistics() const;

    [[nodiscard]] const std::shared_ptr<ProtocolLog>& protocol_log() const noexcept { return protocol_log_; }

private:
    struct Session;

    [[nodiscard]] Status establish(Session& session);
    [[nodiscard]] Result<Json> handshake(Session& session, std::chrono::milliseconds timeout);
    [[nodiscard]] Error explain_stdio_failure(Session& session, Error failure);
    void cancel_attempt(Session& session);
    void teardown(Session& session);

    [[nodiscard]] std::shared_ptr<Session> connected_session() const;
    [[nodiscard]] Result<Json> request(Session& session,
                                       std::string_view method,
                                       std::optional<Json> params,
                                       std::chrono::milliseconds timeout);
    [[nodiscard]] Result<Json> invoke(std::string_view operation,
                                      std::string_view method,
                                      std::optional<Json> params);
    [[nodiscard]] Result<Json> list_page(std::string_view operation,
                                         std::string_view method,
                                         std::string_view key,
                                         const std::optional<std::string>& cursor);

    void set_state(ConnectionState next);
    void dispatch_notification(const Json& notification);
    void record_error(std::string_view operation, const Error& error);

    ProcessSupervisor& supervisor_;
    const CommandValidator& validator_;
    const TransportFactory& factory_;
    std::shared_ptr<ProtocolLog> protocol_log_;
    ServiceConfig config_;
    StartupErrorClassifier classifier_;

    mutable std::mutex mutex_;
    ConnectionState state_{ConnectionState::Idle};
    std::shared_ptr<Session> session_;
    bool cancel_requested_{false};

    std::mutex notification_mutex_;
    NotificationHandler notification_handler_;

    std::atomic<std::uint64_t> requests_sent_{0};
    std::atomic<std::uint64_t> requests_failed_{0};
    std::atomic<std::uint64_t> notifications_received_{0};

    mutable std::mutex stats_mutex_;
    ErrorStatistics stats_;
    std::deque<ErrorRecord> history_;
};

}  // namespace mcpc
