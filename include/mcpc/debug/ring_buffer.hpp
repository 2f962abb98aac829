#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// RingBuffer - fixed-capacity FIFO, oldest element evicted on overflow
// ─────────────────────────────────────────────────────────────────────────────
// Not synchronized; owners guard it with their own mutex.

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : slots_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    /// Appends `value`; returns the evicted element when the buffer was full.
    std::optional<T> push(T value) {
        std::optional<T> evicted;
        if (size_ == slots_.size()) {
            evicted = std::move(slots_[head_]);
            slots_[head_] = std::move(value);
            head_ = (head_ + 1) % slots_.size();
            return evicted;
        }
        slots_[(head_ + size_) % slots_.size()] = std::move(value);
        ++size_;
        return evicted;
    }

    /// Oldest first.
    [[nodiscard]] std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(size_);
        for (std::size_t i = 0; i < size_; ++i) {
            out.push_back(slots_[(head_ + i) % slots_.size()]);
        }
        return out;
    }

    void clear() noexcept {
        for (auto& slot : slots_) {
            slot = T{};
        }
        head_ = 0;
        size_ = 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] bool full() const noexcept { return size_ == slots_.size(); }

private:
    std::vector<T> slots_;
    std::size_t head_{0};
    std::size_t size_{0};
};

}  // namespace mcpc
