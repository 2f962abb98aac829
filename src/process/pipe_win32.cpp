#include "mcpc/process/pipe.hpp"

#include <format>
#include <thread>

#define WIN32_LEAN_AND_MEAN
#include <windows.h>

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
    if (handle_ != kInvalidNativeHandle && handle_ != nullptr) {
        ::CloseHandle(handle_);
    }
    handle_ = kInvalidNativeHandle;
}

Result<bool> Pipe::wait_readable(std::chrono::milliseconds timeout) const {
    if (is_open() == false) {
        return tl::unexpected(Error::transport("Pipe is closed"));
    }

    // Anonymous pipes cannot be waited on; poll PeekNamedPipe instead.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        DWORD available = 0;
        if (::PeekNamedPipe(handle_, nullptr, 0, nullptr, &available, nullptr) == FALSE) {
            // Broken pipe: report readable so the next read observes EOF.
            return true;
        }
        if (available > 0) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

Result<std::size_t> Pipe::read_some(char* buffer, std::size_t size) const {
    DWORD n = 0;
    if (::ReadFile(handle_, buffer, static_cast<DWORD>(size), &n, nullptr) == FALSE) {
        const DWORD code = ::GetLastError();
        if (code == ERROR_BROKEN_PIPE) {
            return std::size_t{0};
        }
        return tl::unexpected(Error::transport(std::format("ReadFile failed: {}", code)));
    }
    return static_cast<std::size_t>(n);
}

Status Pipe::write_all(std::string_view data) const {
    if (is_open() == false) {
        return tl::unexpected(Error::transport("Pipe is closed"));
    }

    std::size_t written = 0;
    while (written < data.size()) {
        DWORD n = 0;
        const BOOL ok = ::WriteFile(handle_, data.data() + written,
                                    static_cast<DWORD>(data.size() - written), &n, nullptr);
        if (ok == FALSE) {
            return tl::unexpected(Error::transport(
                std::format("WriteFile failed: {}", ::GetLastError())));
        }
        written += n;
    }
    return {};
}

}  // namespace mcpc
