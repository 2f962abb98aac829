#include "mcpc/debug/protocol_log.hpp"

#include <format>

namespace mcpc {

ProtocolLog::ProtocolLog(std::size_t capacity)
    : capacity_(capacity)
    , entries_(capacity)
{}

void ProtocolLog::append(Direction direction, MessageKind kind, std::string payload) {
    ProtocolLogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.direction = direction;
    entry.kind = kind;
    entry.payload = std::move(payload);

    std::lock_guard lock(mutex_);
    if (entries_.push(std::move(entry)).has_value()) {
        ++evicted_;
    }
}

std::vector<ProtocolLogEntry> ProtocolLog::snapshot() const {
    std::lock_guard lock(mutex_);
    return entries_.to_vector();
}

void ProtocolLog::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    evicted_ = 0;
}

std::size_t ProtocolLog::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::uint64_t ProtocolLog::evicted() const {
    std::lock_guard lock(mutex_);
    return evicted_;
}

std::string format_entry(const ProtocolLogEntry& entry) {
    const auto ms = std::chrono::floor<std::chrono::milliseconds>(entry.timestamp);
    const char* arrow = entry.direction == Direction::Outbound ? "->" : "<-";
    return std::format("{:%H:%M:%S} {} {:<12} {}",
                       ms, arrow, to_string(entry.kind), entry.payload);
}

}  // namespace mcpc
