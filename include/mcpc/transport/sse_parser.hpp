#pragma once

#include "mcpc/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpc {

/// One dispatched Server-Sent Event.
struct SseEvent {
    std::string event{"message"};       // "endpoint", "message", ...
    std::string data;                   // data lines joined with '\n'
    std::optional<std::string> id;
    std::optional<std::uint32_t> retry;
};

struct SseParserLimits {
    std::size_t max_line_bytes{1024 * 1024};
    std::size_t max_event_bytes{4 * 1024 * 1024};
};

// ─────────────────────────────────────────────────────────────────────────────
// SseParser
// ─────────────────────────────────────────────────────────────────────────────
// Incremental event-stream decoder. Chunks may split lines, CRLF pairs or
// events anywhere; events are returned as soon as their blank line arrives.
// Exceeding a limit fails the feed with a Transport error and resets the parser.

class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserLimits limits) : limits_(limits) {}

    [[nodiscard]] Result<std::vector<SseEvent>> feed(std::string_view chunk);

    /// Dispatches a trailing event that was not followed by a blank line
    /// (complete HTTP bodies). Returns nullopt when nothing is pending.
    [[nodiscard]] std::optional<SseEvent> finish();

    void reset();

    [[nodiscard]] const std::optional<std::string>& last_event_id() const noexcept {
        return last_event_id_;
    }

private:
    void process_line(std::string_view line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    SseParserLimits limits_;
    std::string line_;
    bool skip_lf_{false};  // previous chunk ended in '\r'

    std::string event_type_;
    std::string data_;
    bool has_data_{false};
    std::optional<std::string> pending_id_;
    std::optional<std::uint32_t> pending_retry_;
    std::optional<std::string> last_event_id_;
};

}  // namespace mcpc
