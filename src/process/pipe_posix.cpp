#include "mcpc/process/pipe.hpp"

#include <cerrno>
#include <cstring>
#include <format>

#include <poll.h>
#include <unistd.h>

namespace mcpc {

Pipe::~Pipe() {
    close();
}

Pipe::Pipe(Pipe&& other) noexcept
    : handle_(other.handle_) {
    other.handle_ = kInvalidNativeHandle;
}

Pipe& Pipe::operator=(Pipe&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = other.handle_;
        other.handle_ = kInvalidNativeHandle;
    }
    return *this;
}

void Pipe::close() noexcept {
    if (handle_ != kInvalidNativeHandle) {
        ::close(handle_);
        handle_ = kInvalidNativeHandle;
    }
}

Result<bool> Pipe::wait_readable(std::chrono::milliseconds timeout) const {
    if (is_open() == false) {
        return tl::unexpected(Error::transport("Pipe is closed"));
    }

    struct pollfd pfd{};
    pfd.fd = handle_;
    pfd.events = POLLIN;

    for (;;) {
        const int result = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (result < 0 && errno == EINTR) {
            continue;
        }
        if (result < 0) {
            return tl::unexpected(Error::transport(
                std::format("poll failed: {}", std::strerror(errno))));
        }
        // POLLHUP counts as readable: the next read returns 0.
        return result > 0;
    }
}

Result<std::size_t> Pipe::read_some(char* buffer, std::size_t size) const {
    for (;;) {
        const ssize_t n = ::read(handle_, buffer, size);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        return tl::unexpected(Error::transport(
            std::format("read failed: {}", std::strerror(errno))));
    }
}

Status Pipe::write_all(std::string_view data) const {
    if (is_open() == false) {
        return tl::unexpected(Error::transport("Pipe is closed"));
    }

    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(handle_, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            return tl::unexpected(Error::transport(
                std::format("write failed: {}", std::strerror(errno))));
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

}  // namespace mcpc
