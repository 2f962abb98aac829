#pragma once

#include "mcpc/debug/protocol_log.hpp"
#include "mcpc/transport/transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// InstrumentedTransport - records traffic into a ProtocolLog
// ─────────────────────────────────────────────────────────────────────────────
// Decorator over any Transport. Calls are forwarded unchanged and recorded
// with their direction and kind once the wrapped transport returns; requests
// are recorded on the way out as well. Failures are recorded as Error entries
// and channel lifecycle shows up as TransportEvent entries. A closed decorator
// refuses to start.

class InstrumentedTransport final : public Transport {
public:
    InstrumentedTransport(std::unique_ptr<Transport> inner, std::shared_ptr<ProtocolLog> log);
    ~InstrumentedTransport() override;

    InstrumentedTransport(const InstrumentedTransport&) = delete;
    InstrumentedTransport& operator=(const InstrumentedTransport&) = delete;

    [[nodiscard]] Status start(std::optional<std::chrono::milliseconds> timeout) override;
    [[nodiscard]] Result<Json> send_request(const Json& request,
                                            std::chrono::milliseconds timeout) override;
    [[nodiscard]] Status send_notification(const Json& notification) override;
    void set_notification_handler(NotificationHandler handler) override;
    void close() override;

    [[nodiscard]] TransportKind kind() const noexcept override { return inner_->kind(); }

    [[nodiscard]] Transport& inner() noexcept { return *inner_; }
    [[nodiscard]] const std::shared_ptr<ProtocolLog>& log() const noexcept { return log_; }

private:
    void record(Direction direction, MessageKind kind, std::string payload);

    std::unique_ptr<Transport> inner_;
    std::shared_ptr<ProtocolLog> log_;
    std::atomic<bool> closed_{false};
    std::mutex lifecycle_mutex_;  // orders start() against close()
};

}  // namespace mcpc
