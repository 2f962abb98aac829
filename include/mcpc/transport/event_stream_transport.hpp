#pragma once

#include "mcpc/transport/http_client.hpp"
#include "mcpc/transport/pending_requests.hpp"
#include "mcpc/transport/sse_parser.hpp"
#include "mcpc/transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcpc {

struct EventStreamTransportConfig {
    std::string url;                                  ///< Stream URL (GET)
    HeaderMap headers;                                ///< Sent on the GET and every POST
    std::chrono::milliseconds connect_timeout{10000};
    bool verify_ssl{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// EventStreamTransport - SSE stream in, POSTs out
// ─────────────────────────────────────────────────────────────────────────────
// A long-lived GET yields an `endpoint` event naming the session-scoped POST
// URL; requests are POSTed there and acknowledged immediately, and responses
// come back as `message` events on the stream.
//
// The GET has no read timeout and lives until close() or a server-side close.
// Per-request timeouts only bound waiting for a response, never the stream.

class EventStreamTransport final : public Transport {
public:
    EventStreamTransport(EventStreamTransportConfig config, std::shared_ptr<IHttpClient> client);
    ~EventStreamTransport() override;

    EventStreamTransport(const EventStreamTransport&) = delete;
    EventStreamTransport& operator=(const EventStreamTransport&) = delete;
    EventStreamTransport(EventStreamTransport&&) = delete;
    EventStreamTransport& operator=(EventStreamTransport&&) = delete;

    /// Opens the stream on a background thread. With a timeout, also waits
    /// that long for the endpoint event; with nullopt, returns immediately and
    /// the first request waits for the endpoint instead.
    [[nodiscard]] Status start(std::optional<std::chrono::milliseconds> timeout) override;

    [[nodiscard]] Result<Json> send_request(const Json& request,
                                            std::chrono::milliseconds timeout) override;
    [[nodiscard]] Status send_notification(const Json& notification) override;
    void set_notification_handler(NotificationHandler handler) override;
    void close() override;

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::EventStream; }

    /// True while the GET is open.
    [[nodiscard]] bool stream_open() const noexcept { return stream_open_.load(); }

    /// Session endpoint announced by the server, once known.
    [[nodiscard]] std::optional<std::string> endpoint() const;

private:
    void stream_loop();
    void handle_event(const SseEvent& event);
    void handle_message(const Json& message);
    void fail_stream(Error error);

    /// Blocks until the endpoint is known, the stream fails or `timeout` passes.
    [[nodiscard]] Result<std::string> wait_for_endpoint(std::chrono::milliseconds timeout);

    [[nodiscard]] Status post(const Json& message, std::chrono::milliseconds timeout);

    EventStreamTransportConfig config_;
    std::shared_ptr<IHttpClient> client_;
    std::string stream_url_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stream_open_{false};
    std::thread stream_thread_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::optional<std::string> endpoint_;
    std::optional<Error> stream_error_;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;

    SseParser parser_;  // stream thread only
    PendingRequests pending_;
};

}  // namespace mcpc
