#pragma once

#include "mcpc/error.hpp"
#include "mcpc/json/json.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

namespace mcpc {

enum class TransportKind {
    Stdio,
    EventStream,
    Http
};

[[nodiscard]] constexpr std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Stdio:       return "stdio";
        case TransportKind::EventStream: return "event-stream";
        case TransportKind::Http:        return "http";
    }
    return "unknown";
}

/// Accepts "stdio", "event-stream" / "sse", "http" / "streamable-http".
[[nodiscard]] std::optional<TransportKind> parse_transport_kind(std::string_view name);

/// Receives server-to-client notifications. Called on a transport thread.
using NotificationHandler = std::function<void(const Json& notification)>;

// ─────────────────────────────────────────────────────────────────────────────
// Transport
// ─────────────────────────────────────────────────────────────────────────────
// Carries JSON-RPC messages to one server. Requests are correlated with their
// responses by id; the caller assigns ids.

class Transport {
public:
    virtual ~Transport() = default;

    /// Establishes the channel. `timeout` bounds establishment; nullopt means
    /// establishment is not tied to any caller deadline.
    [[nodiscard]] virtual Status start(std::optional<std::chrono::milliseconds> timeout) = 0;

    /// Sends `request` and waits up to `timeout` for the matching response
    /// message, which is returned whole (result or error member intact).
    [[nodiscard]] virtual Result<Json> send_request(const Json& request,
                                                    std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual Status send_notification(const Json& notification) = 0;

    virtual void set_notification_handler(NotificationHandler handler) = 0;

    /// Idempotent. Pending requests fail with a Transport error.
    virtual void close() = 0;

    [[nodiscard]] virtual TransportKind kind() const noexcept = 0;
};

}  // namespace mcpc
