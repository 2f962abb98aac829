#include "mcpc/transport/stdio_transport.hpp"

#include "mcpc/log/logger.hpp"
#include "mcpc/protocol/json_rpc.hpp"

#include <array>
#include <format>

namespace mcpc {

StdioTransport::StdioTransport(ProcessPipes pipes, StdioTransportConfig config)
    : pipes_(std::move(pipes))
    , config_(std::move(config))
{}

StdioTransport::~StdioTransport() {
    close();
}

Status StdioTransport::start(std::optional<std::chrono::milliseconds> /*timeout*/) {
    // The pipes already exist; there is nothing to wait for.
    if (running_.exchange(true)) {
        return tl::unexpected(Error::transport("Stdio transport already started"));
    }
    if (pipes_.stdout_pipe.is_open() == false || pipes_.stdin_pipe.is_open() == false) {
        running_ = false;
        return tl::unexpected(Error::transport("Stdio transport has no process pipes"));
    }

    pending_.reopen();
    stdout_thread_ = std::thread([this] { stdout_loop(); });
    if (pipes_.stderr_pipe.is_open()) {
        stderr_thread_ = std::thread([this] { stderr_loop(); });
    }
    MCPC_LOG_DEBUG("Stdio transport started");
    return {};
}

Result<Json> StdioTransport::send_request(const Json& request, std::chrono::milliseconds timeout) {
    if (running_.load() == false) {
        return tl::unexpected(Error::transport("Stdio transport is not running"));
    }
    const auto id = message_id(request);
    if (id.has_value() == false) {
        return tl::unexpected(Error::protocol("Request has no integer id"));
    }

    auto future = pending_.add(*id);
    if (future.has_value() == false) {
        return tl::unexpected(std::move(future.error()));
    }

    if (auto written = write_message(request); written.has_value() == false) {
        pending_.remove(*id);
        return tl::unexpected(std::move(written.error()));
    }

    return pending_.await(*id, *future, timeout);
}

Status StdioTransport::send_notification(const Json& notification) {
    if (running_.load() == false) {
        return tl::unexpected(Error::transport("Stdio transport is not running"));
    }
    return write_message(notification);
}

void StdioTransport::set_notification_handler(NotificationHandler handler) {
    std::lock_guard lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

void StdioTransport::close() {
    const bool was_running = running_.exchange(false);

    // Closing stdin is the polite shutdown signal for stdio servers.
    {
        std::lock_guard lock(write_mutex_);
        pipes_.stdin_pipe.close();
    }

    // Readers notice running_ within one poll interval.
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }

    pending_.fail_all(Error::transport("Transport closed"));
    drain_diagnostics();
    pipes_.stdout_pipe.close();
    pipes_.stderr_pipe.close();

    if (was_running) {
        MCPC_LOG_DEBUG("Stdio transport closed");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Reader loops
// ─────────────────────────────────────────────────────────────────────────────

void StdioTransport::stdout_loop() {
    std::array<char, 8192> buffer{};
    std::string line;

    while (running_.load()) {
        auto ready = pipes_.stdout_pipe.wait_readable(config_.poll_interval);
        if (ready.has_value() == false) {
            get_logger().warn_fmt("stdout poll failed: {}", ready.error().message);
            break;
        }
        if (*ready == false) {
            continue;
        }

        auto n = pipes_.stdout_pipe.read_some(buffer.data(), buffer.size());
        if (n.has_value() == false) {
            get_logger().warn_fmt("stdout read failed: {}", n.error().message);
            break;
        }
        if (*n == 0) {
            eof_ = true;
            break;
        }

        for (std::size_t i = 0; i < *n; ++i) {
            const char c = buffer[i];
            if (c != '\n') {
                line.push_back(c);
                continue;
            }
            if (line.empty() == false && line.back() == '\r') {
                line.pop_back();
            }
            handle_line(line);
            line.clear();
        }

        if (line.size() > config_.max_line_bytes) {
            get_logger().warn_fmt("Discarding {} byte stdout line without newline", line.size());
            emit_diagnostic(excerpt(line));
            line.clear();
        }
    }

    // A partial last line is still useful evidence.
    if (line.empty() == false) {
        handle_line(line);
    }

    if (eof_.load()) {
        MCPC_LOG_DEBUG("Server closed stdout");
        pending_.fail_all(Error::transport("Server closed its output stream"));
    }
}

void StdioTransport::stderr_loop() {
    std::array<char, 4096> buffer{};

    while (running_.load()) {
        auto ready = pipes_.stderr_pipe.wait_readable(config_.poll_interval);
        if (ready.has_value() == false || *ready == false) {
            if (ready.has_value() == false) {
                break;
            }
            continue;
        }

        auto n = pipes_.stderr_pipe.read_some(buffer.data(), buffer.size());
        if (n.has_value() == false || *n == 0) {
            break;
        }

        const std::string_view chunk(buffer.data(), *n);
        get_logger().debug_fmt("server stderr: {}", chunk);
        emit_diagnostic(chunk);
    }
}

void StdioTransport::drain_diagnostics() {
    // Whatever a dead server left in its pipes is startup evidence.
    std::array<char, 4096> buffer{};
    for (Pipe* pipe : {&pipes_.stdout_pipe, &pipes_.stderr_pipe}) {
        std::size_t drained = 0;
        while (pipe->is_open() && drained < config_.max_drain_bytes) {
            auto ready = pipe->wait_readable(std::chrono::milliseconds{0});
            if (ready.has_value() == false || *ready == false) {
                break;
            }
            auto n = pipe->read_some(buffer.data(), buffer.size());
            if (n.has_value() == false || *n == 0) {
                break;
            }
            drained += *n;
            emit_diagnostic(std::string_view(buffer.data(), *n));
        }
    }
}

void StdioTransport::handle_line(std::string_view line) {
    if (line.find_first_not_of(" \t") == std::string_view::npos) {
        return;
    }

    if (looks_like_json_object(line) == false) {
        std::string text(line);
        text.push_back('\n');
        emit_diagnostic(text);
        return;
    }

    auto message = parse_json(line);
    if (message.has_value() == false) {
        std::string text(line);
        text.push_back('\n');
        emit_diagnostic(text);
        return;
    }

    switch (classify_message(*message)) {
        case MessageType::Response:
            if (pending_.resolve(*message) == false) {
                get_logger().debug_fmt("Dropping response with no waiter: {}", excerpt(line));
            }
            break;

        case MessageType::Notification: {
            NotificationHandler handler;
            {
                std::lock_guard lock(handler_mutex_);
                handler = notification_handler_;
            }
            if (handler) {
                handler(*message);
            }
            break;
        }

        case MessageType::Request: {
            // Server-initiated requests (sampling, roots, ...) are not supported.
            get_logger().debug_fmt("Rejecting server request '{}'", message_method(*message));
            const auto reply = make_error_response(
                (*message)["id"], rpc_code::kMethodNotFound, "Method not supported by this client");
            if (auto written = write_message(reply); written.has_value() == false) {
                get_logger().warn_fmt("Failed to reject server request: {}", written.error().message);
            }
            break;
        }

        case MessageType::Invalid: {
            std::string text(line);
            text.push_back('\n');
            emit_diagnostic(text);
            break;
        }
    }
}

void StdioTransport::emit_diagnostic(std::string_view text) {
    if (config_.on_diagnostic_output) {
        config_.on_diagnostic_output(text);
    }
}

Status StdioTransport::write_message(const Json& message) {
    std::string line = message.dump();
    line.push_back('\n');

    std::lock_guard lock(write_mutex_);
    return pipes_.stdin_pipe.write_all(line);
}

}  // namespace mcpc
