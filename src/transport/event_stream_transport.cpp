#include "mcpc/transport/event_stream_transport.hpp"

#include "mcpc/log/logger.hpp"
#include "mcpc/protocol/json_rpc.hpp"

#include <format>

namespace mcpc {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds remaining_until(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

}  // namespace

EventStreamTransport::EventStreamTransport(EventStreamTransportConfig config,
                                           std::shared_ptr<IHttpClient> client)
    : config_(std::move(config))
    , client_(std::move(client))
{}

EventStreamTransport::~EventStreamTransport() {
    close();
}

Status EventStreamTransport::start(std::optional<std::chrono::milliseconds> timeout) {
    if (client_ == nullptr) {
        return tl::unexpected(Error::transport("Event-stream transport has no HTTP client"));
    }

    auto url = normalize_http_url(config_.url);
    if (url.has_value() == false) {
        return tl::unexpected(std::move(url.error()));
    }
    stream_url_ = std::move(*url);

    if (running_.exchange(true)) {
        return tl::unexpected(Error::transport("Event-stream transport already started"));
    }

    client_->set_default_headers(config_.headers);
    client_->set_connect_timeout(config_.connect_timeout);
    client_->set_verify_ssl(config_.verify_ssl);

    {
        std::lock_guard lock(state_mutex_);
        endpoint_.reset();
        stream_error_.reset();
    }
    parser_.reset();
    pending_.reopen();

    stream_thread_ = std::thread([this] { stream_loop(); });
    get_logger().debug_fmt("Opening event stream {}", stream_url_);

    if (timeout.has_value() == false) {
        return {};
    }

    auto endpoint = wait_for_endpoint(*timeout);
    if (endpoint.has_value() == false) {
        close();
        return tl::unexpected(std::move(endpoint.error()));
    }
    return {};
}

Result<Json> EventStreamTransport::send_request(const Json& request,
                                                std::chrono::milliseconds timeout) {
    if (running_.load() == false) {
        return tl::unexpected(Error::transport("Event-stream transport is not running"));
    }
    const auto id = message_id(request);
    if (id.has_value() == false) {
        return tl::unexpected(Error::protocol("Request has no integer id"));
    }

    const auto deadline = Clock::now() + timeout;

    auto future = pending_.add(*id);
    if (future.has_value() == false) {
        return tl::unexpected(std::move(future.error()));
    }

    if (auto sent = post(request, remaining_until(deadline)); sent.has_value() == false) {
        pending_.remove(*id);
        return tl::unexpected(std::move(sent.error()));
    }

    return pending_.await(*id, *future, remaining_until(deadline));
}

Status EventStreamTransport::send_notification(const Json& notification) {
    if (running_.load() == false) {
        return tl::unexpected(Error::transport("Event-stream transport is not running"));
    }
    return post(notification, config_.connect_timeout);
}

void EventStreamTransport::set_notification_handler(NotificationHandler handler) {
    std::lock_guard lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

void EventStreamTransport::close() {
    const bool was_running = running_.exchange(false);
    state_cv_.notify_all();

    // keep_open() observes running_ and aborts the GET.
    if (stream_thread_.joinable()) {
        stream_thread_.join();
    }
    pending_.fail_all(Error::transport("Transport closed"));

    if (was_running) {
        MCPC_LOG_DEBUG("Event-stream transport closed");
    }
}

std::optional<std::string> EventStreamTransport::endpoint() const {
    std::lock_guard lock(state_mutex_);
    return endpoint_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Stream
// ─────────────────────────────────────────────────────────────────────────────

void EventStreamTransport::stream_loop() {
    HeaderMap headers{{"Accept", "text/event-stream"}, {"Cache-Control", "no-cache"}};

    HttpStreamHandlers handlers;
    handlers.on_open = [this](int status, const HeaderMap& /*headers*/) {
        if (status < 200 || status >= 300) {
            fail_stream(Error::transport(
                std::format("Event stream returned HTTP {}", status), status));
            return false;
        }
        stream_open_ = true;
        MCPC_LOG_DEBUG("Event stream open");
        return true;
    };
    handlers.on_data = [this](std::string_view chunk) {
        auto events = parser_.feed(chunk);
        if (events.has_value() == false) {
            fail_stream(std::move(events.error()));
            return false;
        }
        for (const auto& event : *events) {
            handle_event(event);
        }
        return running_.load();
    };
    handlers.keep_open = [this] { return running_.load(); };

    auto result = client_->stream_get(stream_url_, headers, std::move(handlers));
    stream_open_ = false;

    if (running_.load() == false) {
        return;  // closed locally
    }

    if (result.has_value() == false) {
        fail_stream(result.error().to_error());
    } else {
        fail_stream(Error::transport("Event stream closed by server", *result));
    }
}

void EventStreamTransport::handle_event(const SseEvent& event) {
    if (event.event == "endpoint") {
        auto resolved = resolve_url(stream_url_, event.data);
        if (resolved.has_value() == false) {
            fail_stream(Error::protocol("Server announced an invalid endpoint")
                            .with_evidence(excerpt(event.data)));
            return;
        }
        get_logger().debug_fmt("Event stream endpoint: {}", *resolved);
        {
            std::lock_guard lock(state_mutex_);
            endpoint_ = std::move(*resolved);
        }
        state_cv_.notify_all();
        return;
    }

    if (event.event != "message") {
        get_logger().trace_fmt("Ignoring '{}' event", event.event);
        return;
    }

    auto message = parse_json(event.data);
    if (message.has_value() == false) {
        get_logger().warn_fmt("Discarding malformed message event: {}", message.error().message);
        return;
    }
    handle_message(*message);
}

void EventStreamTransport::handle_message(const Json& message) {
    switch (classify_message(message)) {
        case MessageType::Response:
            if (pending_.resolve(message) == false) {
                get_logger().debug_fmt("Dropping response with no waiter: {}", excerpt(message.dump()));
            }
            break;

        case MessageType::Notification: {
            NotificationHandler handler;
            {
                std::lock_guard lock(handler_mutex_);
                handler = notification_handler_;
            }
            if (handler) {
                handler(message);
            }
            break;
        }

        case MessageType::Request: {
            const auto reply = make_error_response(
                message["id"], rpc_code::kMethodNotFound, "Method not supported by this client");
            if (auto sent = post(reply, config_.connect_timeout); sent.has_value() == false) {
                get_logger().warn_fmt("Failed to reject server request: {}", sent.error().message);
            }
            break;
        }

        case MessageType::Invalid:
            get_logger().warn_fmt("Discarding invalid message: {}", excerpt(message.dump()));
            break;
    }
}

void EventStreamTransport::fail_stream(Error error) {
    get_logger().warn_fmt("Event stream failed: {}", error.message);
    {
        std::lock_guard lock(state_mutex_);
        if (stream_error_.has_value() == false) {
            stream_error_ = error;
        }
    }
    state_cv_.notify_all();
    pending_.fail_all(error);
}

Result<std::string> EventStreamTransport::wait_for_endpoint(std::chrono::milliseconds timeout) {
    std::unique_lock lock(state_mutex_);
    const bool ready = state_cv_.wait_for(lock, timeout, [this] {
        return endpoint_.has_value() || stream_error_.has_value() || running_.load() == false;
    });

    if (stream_error_.has_value()) {
        return tl::unexpected(*stream_error_);
    }
    if (endpoint_.has_value()) {
        return *endpoint_;
    }
    if (ready) {
        return tl::unexpected(Error::transport("Transport closed"));
    }
    return tl::unexpected(Error::transport(
        std::format("No endpoint event within {} ms", timeout.count())));
}

Status EventStreamTransport::post(const Json& message, std::chrono::milliseconds timeout) {
    auto endpoint = wait_for_endpoint(timeout);
    if (endpoint.has_value() == false) {
        return tl::unexpected(std::move(endpoint.error()));
    }

    auto response = client_->post(*endpoint, message.dump(), "application/json", {}, timeout);
    if (response.has_value() == false) {
        return tl::unexpected(response.error().to_error());
    }
    if (response->is_success() == false) {
        return tl::unexpected(
            Error::transport(std::format("POST {} returned HTTP {}", *endpoint, response->status_code),
                             response->status_code)
                .with_evidence(excerpt(response->body)));
    }
    return {};
}

}  // namespace mcpc
