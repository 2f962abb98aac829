#include "mcpc/transport/sse_parser.hpp"

#include <charconv>
#include <format>

namespace mcpc {

Result<std::vector<SseEvent>> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    for (const char c : chunk) {
        if (skip_lf_) {
            skip_lf_ = false;
            if (c == '\n') {
                continue;
            }
        }

        if (c == '\r' || c == '\n') {
            skip_lf_ = (c == '\r');
            process_line(line_, events);
            line_.clear();
        } else {
            line_.push_back(c);
            if (line_.size() > limits_.max_line_bytes) {
                reset();
                return tl::unexpected(Error::transport(
                    std::format("Event-stream line exceeds {} bytes", limits_.max_line_bytes)));
            }
        }

        if (data_.size() > limits_.max_event_bytes) {
            reset();
            return tl::unexpected(Error::transport(
                std::format("Event-stream event exceeds {} bytes", limits_.max_event_bytes)));
        }
    }

    return events;
}

std::optional<SseEvent> SseParser::finish() {
    std::vector<SseEvent> events;
    if (line_.empty() == false) {
        process_line(line_, events);
        line_.clear();
    }
    dispatch(events);
    if (events.empty()) {
        return std::nullopt;
    }
    return std::move(events.front());
}

void SseParser::reset() {
    line_.clear();
    skip_lf_ = false;
    event_type_.clear();
    data_.clear();
    has_data_ = false;
    pending_id_.reset();
    pending_retry_.reset();
}

void SseParser::process_line(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line.front() == ':') {
        return;  // comment / keep-alive
    }

    std::string_view field = line;
    std::string_view value;
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (value.empty() == false && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "event") {
        event_type_ = std::string(value);
    } else if (field == "data") {
        if (has_data_) {
            data_.push_back('\n');
        }
        data_.append(value);
        has_data_ = true;
    } else if (field == "id") {
        if (value.find('\0') == std::string_view::npos) {
            pending_id_ = std::string(value);
        }
    } else if (field == "retry") {
        std::uint32_t ms = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
        if (ec == std::errc{} && ptr == value.data() + value.size()) {
            pending_retry_ = ms;
        }
    }
    // Unknown fields are ignored.
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
    if (pending_id_.has_value()) {
        last_event_id_ = pending_id_;
    }

    if (has_data_) {
        SseEvent event;
        if (event_type_.empty() == false) {
            event.event = std::move(event_type_);
        }
        event.data = std::move(data_);
        event.id = last_event_id_;
        event.retry = pending_retry_;
        out.push_back(std::move(event));
    }

    event_type_.clear();
    data_.clear();
    has_data_ = false;
    pending_id_.reset();
    pending_retry_.reset();
}

}  // namespace mcpc
