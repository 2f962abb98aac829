#pragma once

#include "mcpc/transport/http_client.hpp"
#include "mcpc/transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpc {

struct HttpTransportConfig {
    std::string url;
    HeaderMap headers;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds close_timeout{5000};  ///< Bounds the session DELETE
    bool verify_ssl{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpTransport - one POST per message
// ─────────────────────────────────────────────────────────────────────────────
// Each request is a bounded POST. The reply body is either the JSON-RPC
// response itself or an event stream that carries it (plus any notifications
// the server emits while handling the request). The Mcp-Session-Id the server
// hands out is echoed on every later request and released on close().

class HttpTransport final : public Transport {
public:
    HttpTransport(HttpTransportConfig config, std::shared_ptr<IHttpClient> client);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;
    HttpTransport(HttpTransport&&) = delete;
    HttpTransport& operator=(HttpTransport&&) = delete;

    /// Validates the URL; the first request opens the connection.
    [[nodiscard]] Status start(std::optional<std::chrono::milliseconds> timeout) override;

    [[nodiscard]] Result<Json> send_request(const Json& request,
                                            std::chrono::milliseconds timeout) override;
    [[nodiscard]] Status send_notification(const Json& notification) override;
    void set_notification_handler(NotificationHandler handler) override;
    void close() override;

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::Http; }

    [[nodiscard]] std::optional<std::string> session_id() const;

private:
    [[nodiscard]] HeaderMap request_headers() const;
    [[nodiscard]] Result<HttpClientResponse> post(const Json& message,
                                                  std::chrono::milliseconds timeout);
    [[nodiscard]] Result<Json> response_from_event_stream(const HttpClientResponse& response,
                                                          std::int64_t id);
    void dispatch_notification(const Json& message);

    HttpTransportConfig config_;
    std::shared_ptr<IHttpClient> client_;
    std::string url_;
    std::atomic<bool> running_{false};

    mutable std::mutex session_mutex_;
    std::optional<std::string> session_id_;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;
};

}  // namespace mcpc
