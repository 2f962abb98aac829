#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace mcpc {

/// Collects what a stdio server prints before the handshake completes. Stops
/// accepting text once sealed or once `limit` bytes are held.
class EarlyOutputBuffer {
public:
    explicit EarlyOutputBuffer(std::size_t limit) : limit_(limit) {}

    void append(std::string_view text) {
        std::lock_guard lock(mutex_);
        if (sealed_) {
            return;
        }
        const auto room = limit_ - text_.size();
        if (text.size() > room) {
            truncated_ = true;
            text = text.substr(0, room);
        }
        text_.append(text);
    }

    void seal() {
        std::lock_guard lock(mutex_);
        sealed_ = true;
    }

    [[nodiscard]] std::string text() const {
        std::lock_guard lock(mutex_);
        return text_;
    }

    [[nodiscard]] bool truncated() const {
        std::lock_guard lock(mutex_);
        return truncated_;
    }

private:
    const std::size_t limit_;
    mutable std::mutex mutex_;
    std::string text_;
    bool sealed_{false};
    bool truncated_{false};
};

}  // namespace mcpc
