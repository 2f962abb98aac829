#pragma once

#include "mcpc/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace mcpc {

#if defined(_WIN32)
using NativeHandle = void*;          // HANDLE
inline const NativeHandle kInvalidNativeHandle = reinterpret_cast<void*>(-1);
#else
using NativeHandle = int;            // file descriptor
inline constexpr NativeHandle kInvalidNativeHandle = -1;
#endif

// ─────────────────────────────────────────────────────────────────────────────
// Pipe - owning wrapper around one end of an anonymous pipe
// ─────────────────────────────────────────────────────────────────────────────

class Pipe {
public:
    Pipe() noexcept = default;
    explicit Pipe(NativeHandle handle) noexcept : handle_(handle) {}
    ~Pipe();

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    Pipe(Pipe&& other) noexcept;
    Pipe& operator=(Pipe&& other) noexcept;

    [[nodiscard]] bool is_open() const noexcept { return handle_ != kInvalidNativeHandle; }
    [[nodiscard]] NativeHandle native_handle() const noexcept { return handle_; }

    /// Waits up to `timeout` for data (or EOF) to become readable.
    [[nodiscard]] Result<bool> wait_readable(std::chrono::milliseconds timeout) const;

    /// Returns 0 on end of stream.
    [[nodiscard]] Result<std::size_t> read_some(char* buffer, std::size_t size) const;

    [[nodiscard]] Status write_all(std::string_view data) const;

    void close() noexcept;

private:
    NativeHandle handle_{kInvalidNativeHandle};
};

/// Parent-side ends of a child's standard streams.
struct ProcessPipes {
    Pipe stdin_pipe;   // write end
    Pipe stdout_pipe;  // read end
    Pipe stderr_pipe;  // read end
};

}  // namespace mcpc
