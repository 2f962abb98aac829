#pragma once

#include "mcpc/process/pipe.hpp"
#include "mcpc/transport/pending_requests.hpp"
#include "mcpc/transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace mcpc {

/// Receives bytes a server printed that are not protocol messages: all of
/// stderr, and stdout lines that are not JSON-RPC.
using DiagnosticOutputHandler = std::function<void(std::string_view text)>;

struct StdioTransportConfig {
    std::size_t max_line_bytes{16 * 1024 * 1024};
    std::chrono::milliseconds poll_interval{100};  ///< Reader wake-up period
    std::size_t max_drain_bytes{64 * 1024};        ///< Read from the pipes on close()
    DiagnosticOutputHandler on_diagnostic_output;
};

// ─────────────────────────────────────────────────────────────────────────────
// StdioTransport - newline-delimited JSON-RPC over a child's pipes
// ─────────────────────────────────────────────────────────────────────────────
// Owns the pipe ends only; the process belongs to ProcessSupervisor. Two reader
// threads run between start() and close(): one for stdout, one for stderr.

class StdioTransport final : public Transport {
public:
    StdioTransport(ProcessPipes pipes, StdioTransportConfig config = {});
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;
    StdioTransport(StdioTransport&&) = delete;
    StdioTransport& operator=(StdioTransport&&) = delete;

    [[nodiscard]] Status start(std::optional<std::chrono::milliseconds> timeout) override;
    [[nodiscard]] Result<Json> send_request(const Json& request,
                                            std::chrono::milliseconds timeout) override;
    [[nodiscard]] Status send_notification(const Json& notification) override;
    void set_notification_handler(NotificationHandler handler) override;
    void close() override;

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::Stdio; }

    /// True once the server closed its stdout.
    [[nodiscard]] bool reached_eof() const noexcept { return eof_.load(); }

private:
    void stdout_loop();
    void stderr_loop();
    void handle_line(std::string_view line);
    void emit_diagnostic(std::string_view text);
    void drain_diagnostics();
    [[nodiscard]] Status write_message(const Json& message);

    ProcessPipes pipes_;
    StdioTransportConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> eof_{false};
    std::thread stdout_thread_;
    std::thread stderr_thread_;

    std::mutex write_mutex_;
    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;

    PendingRequests pending_;
};

}  // namespace mcpc
