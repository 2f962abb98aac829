#include "mcpc/debug/instrumented_transport.hpp"

#include "mcpc/log/logger.hpp"

#include <format>

namespace mcpc {

InstrumentedTransport::InstrumentedTransport(std::unique_ptr<Transport> inner,
                                             std::shared_ptr<ProtocolLog> log)
    : inner_(std::move(inner))
    , log_(std::move(log))
{}

InstrumentedTransport::~InstrumentedTransport() {
    close();
}

Status InstrumentedTransport::start(std::optional<std::chrono::milliseconds> timeout) {
    // A transport closed before it started must stay closed.
    std::lock_guard lock(lifecycle_mutex_);
    if (closed_.load()) {
        return tl::unexpected(Error::transport("Transport closed before start"));
    }

    auto started = inner_->start(timeout);
    record(Direction::Outbound, MessageKind::TransportEvent,
           std::format("start {}", to_string(inner_->kind())));
    if (started.has_value() == false) {
        record(Direction::Inbound, MessageKind::Error, started.error().describe());
    }
    return started;
}

Result<Json> InstrumentedTransport::send_request(const Json& request,
                                                 std::chrono::milliseconds timeout) {
    record(Direction::Outbound, MessageKind::Request, request.dump());

    auto response = inner_->send_request(request, timeout);
    if (response.has_value()) {
        record(Direction::Inbound, MessageKind::Response, response->dump());
    } else {
        record(Direction::Inbound, MessageKind::Error, response.error().describe());
    }
    return response;
}

Status InstrumentedTransport::send_notification(const Json& notification) {
    auto sent = inner_->send_notification(notification);
    record(Direction::Outbound, MessageKind::Notification, notification.dump());
    if (sent.has_value() == false) {
        record(Direction::Inbound, MessageKind::Error, sent.error().describe());
    }
    return sent;
}

void InstrumentedTransport::set_notification_handler(NotificationHandler handler) {
    inner_->set_notification_handler([this, handler = std::move(handler)](const Json& notification) {
        record(Direction::Inbound, MessageKind::Notification, notification.dump());
        if (handler) {
            handler(notification);
        }
    });
}

void InstrumentedTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(lifecycle_mutex_);
        inner_->close();
    }
    record(Direction::Outbound, MessageKind::TransportEvent,
           std::format("close {}", to_string(inner_->kind())));
}

void InstrumentedTransport::record(Direction direction, MessageKind kind, std::string payload) {
    get_logger().trace_fmt("{} {} {}", to_string(direction), to_string(kind), payload);
    if (log_) {
        log_->append(direction, kind, std::move(payload));
    }
}

}  // namespace mcpc
