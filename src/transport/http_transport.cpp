#include "mcpc/transport/http_transport.hpp"

#include "mcpc/log/logger.hpp"
#include "mcpc/protocol/json_rpc.hpp"
#include "mcpc/transport/sse_parser.hpp"

#include <format>

namespace mcpc {

namespace {

constexpr const char* kSessionHeader = "Mcp-Session-Id";

}  // namespace

HttpTransport::HttpTransport(HttpTransportConfig config, std::shared_ptr<IHttpClient> client)
    : config_(std::move(config))
    , client_(std::move(client))
{}

HttpTransport::~HttpTransport() {
    close();
}

Status HttpTransport::start(std::optional<std::chrono::milliseconds> /*timeout*/) {
    if (client_ == nullptr) {
        return tl::unexpected(Error::transport("HTTP transport has no HTTP client"));
    }
    auto url = normalize_http_url(config_.url);
    if (url.has_value() == false) {
        return tl::unexpected(std::move(url.error()));
    }
    url_ = std::move(*url);

    client_->set_default_headers(config_.headers);
    client_->set_connect_timeout(config_.connect_timeout);
    client_->set_verify_ssl(config_.verify_ssl);

    running_ = true;
    get_logger().debug_fmt("HTTP transport targeting {}", url_);
    return {};
}

Result<Json> HttpTransport::send_request(const Json& request, std::chrono::milliseconds timeout) {
    if (running_.load() == false) {
        return tl::unexpected(Error::transport("HTTP transport is not running"));
    }
    const auto id = message_id(request);
    if (id.has_value() == false) {
        return tl::unexpected(Error::protocol("Request has no integer id"));
    }

    auto response = post(request, timeout);
    if (response.has_value() == false) {
        return tl::unexpected(std::move(response.error()));
    }

    if (response->is_sse()) {
        return response_from_event_stream(*response, *id);
    }

    auto message = parse_json(response->body);
    if (message.has_value() == false) {
        return tl::unexpected(std::move(message.error()));
    }
    if (classify_message(*message) != MessageType::Response || message_id(*message) != id) {
        return tl::unexpected(Error::protocol(std::format("Reply is not the response to request {}", *id))
                                  .with_evidence(excerpt(response->body)));
    }
    return std::move(*message);
}

Status HttpTransport::send_notification(const Json& notification) {
    if (running_.load() == false) {
        return tl::unexpected(Error::transport("HTTP transport is not running"));
    }
    // 202 Accepted with an empty body is the normal reply.
    auto response = post(notification, config_.connect_timeout);
    if (response.has_value() == false) {
        return tl::unexpected(std::move(response.error()));
    }
    return {};
}

void HttpTransport::set_notification_handler(NotificationHandler handler) {
    std::lock_guard lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

void HttpTransport::close() {
    if (running_.exchange(false) == false) {
        return;
    }

    auto session = session_id();
    if (session.has_value() == false) {
        return;
    }

    auto result = client_->del(url_, request_headers(), config_.close_timeout);
    if (result.has_value() == false) {
        get_logger().debug_fmt("Session DELETE failed: {}", result.error().message);
    } else if (result->is_success() == false && result->status_code != 405) {
        // 405 means the server does not support explicit termination.
        get_logger().debug_fmt("Session DELETE returned HTTP {}", result->status_code);
    }

    std::lock_guard lock(session_mutex_);
    session_id_.reset();
}

std::optional<std::string> HttpTransport::session_id() const {
    std::lock_guard lock(session_mutex_);
    return session_id_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

HeaderMap HttpTransport::request_headers() const {
    HeaderMap headers{{"Accept", "application/json, text/event-stream"}};
    if (auto session = session_id(); session.has_value()) {
        headers[kSessionHeader] = *session;
    }
    return headers;
}

Result<HttpClientResponse> HttpTransport::post(const Json& message, std::chrono::milliseconds timeout) {
    auto response = client_->post(url_, message.dump(), "application/json", request_headers(), timeout);
    if (response.has_value() == false) {
        return tl::unexpected(response.error().to_error());
    }

    if (auto session = get_header(response->headers, kSessionHeader); session.has_value()) {
        std::lock_guard lock(session_mutex_);
        if (session_id_ != session) {
            get_logger().debug_fmt("HTTP session id: {}", *session);
            session_id_ = std::move(session);
        }
    }

    if (response->status_code == 404 && session_id().has_value()) {
        std::lock_guard lock(session_mutex_);
        session_id_.reset();
        return tl::unexpected(Error::transport("HTTP session expired", 404)
                                  .with_evidence(excerpt(response->body)));
    }
    if (response->is_success() == false) {
        return tl::unexpected(
            Error::transport(std::format("Server returned HTTP {}", response->status_code),
                             response->status_code)
                .with_evidence(excerpt(response->body)));
    }
    return std::move(*response);
}

Result<Json> HttpTransport::response_from_event_stream(const HttpClientResponse& response,
                                                       std::int64_t id) {
    SseParser parser;
    auto events = parser.feed(response.body);
    if (events.has_value() == false) {
        return tl::unexpected(std::move(events.error()));
    }
    if (auto trailing = parser.finish(); trailing.has_value()) {
        events->push_back(std::move(*trailing));
    }

    std::optional<Json> matched;
    for (const auto& event : *events) {
        if (event.event != "message" || event.data.empty()) {
            continue;
        }
        auto message = parse_json(event.data);
        if (message.has_value() == false) {
            get_logger().warn_fmt("Discarding malformed message event: {}", message.error().message);
            continue;
        }
        const auto type = classify_message(*message);
        if (type == MessageType::Response && message_id(*message) == id) {
            matched = std::move(*message);
        } else if (type == MessageType::Notification) {
            dispatch_notification(*message);
        }
    }

    if (matched.has_value() == false) {
        return tl::unexpected(Error::protocol(std::format("No response to request {} in event stream", id))
                                  .with_evidence(excerpt(response.body)));
    }
    return std::move(*matched);
}

void HttpTransport::dispatch_notification(const Json& message) {
    NotificationHandler handler;
    {
        std::lock_guard lock(handler_mutex_);
        handler = notification_handler_;
    }
    if (handler) {
        handler(message);
    }
}

}  // namespace mcpc
