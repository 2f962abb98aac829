#pragma once

#include "mcpc/debug/ring_buffer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpc {

enum class Direction : std::uint8_t {
    Outbound,
    Inbound
};

enum class MessageKind : std::uint8_t {
    Request,
    Response,
    Notification,
    TransportEvent,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(Direction direction) noexcept {
    return direction == Direction::Outbound ? "outbound" : "inbound";
}

[[nodiscard]] constexpr std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Request:        return "request";
        case MessageKind::Response:       return "response";
        case MessageKind::Notification:   return "notification";
        case MessageKind::TransportEvent: return "transport";
        case MessageKind::Error:          return "error";
    }
    return "unknown";
}

struct ProtocolLogEntry {
    std::chrono::system_clock::time_point timestamp{};
    Direction direction{Direction::Outbound};
    MessageKind kind{MessageKind::TransportEvent};
    std::string payload;
};

inline constexpr std::size_t kDefaultProtocolLogCapacity = 1000;

// ─────────────────────────────────────────────────────────────────────────────
// ProtocolLog - bounded record of protocol traffic
// ─────────────────────────────────────────────────────────────────────────────
// Written by InstrumentedTransport; read by debug views through snapshot().
// One instance per connection service, created by the composition root.

class ProtocolLog {
public:
    explicit ProtocolLog(std::size_t capacity = kDefaultProtocolLogCapacity);

    void append(Direction direction, MessageKind kind, std::string payload);

    /// Copy of the retained entries, oldest first.
    [[nodiscard]] std::vector<ProtocolLogEntry> snapshot() const;

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Entries dropped by eviction since construction or the last clear().
    [[nodiscard]] std::uint64_t evicted() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    RingBuffer<ProtocolLogEntry> entries_;
    std::uint64_t evicted_{0};
};

/// "HH:MM:SS.mmm outbound request  {...}" - one line per entry.
[[nodiscard]] std::string format_entry(const ProtocolLogEntry& entry);

}  // namespace mcpc
