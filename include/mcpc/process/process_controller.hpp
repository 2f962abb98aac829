#pragma once

#include "mcpc/error.hpp"
#include "mcpc/process/pipe.hpp"
#include "mcpc/security/command_validator.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// Platform handles
// ─────────────────────────────────────────────────────────────────────────────

/// Identifies a child and the group used to signal its whole subtree.
/// POSIX: `group` is the process-group id. Windows: `group` is the job object
/// and `process` the process handle.
struct ProcessHandle {
    std::int64_t pid{-1};
    std::intptr_t group{-1};
    std::intptr_t process{-1};
};

struct SpawnOptions {
    std::map<std::string, std::string> env;  ///< Overrides on top of the inherited environment
    std::string working_directory;           ///< Empty keeps the current directory
};

struct ChildProcess {
    ProcessHandle handle;
    ProcessPipes pipes;
};

enum class StopMode {
    Graceful,  ///< SIGTERM / CTRL_BREAK to the group
    Force      ///< SIGKILL / TerminateJobObject
};

struct ReapStatus {
    enum class State {
        Running,
        Exited,
        Lost  ///< The OS no longer knows the child; exit code unavailable
    };

    State state{State::Running};
    int exit_code{-1};
};

// ─────────────────────────────────────────────────────────────────────────────
// ProcessController - OS primitives behind ProcessSupervisor
// ─────────────────────────────────────────────────────────────────────────────
// ProcessSupervisor owns the lifecycle policy (grace windows, tracking, the
// reaper, parallel kill-all); a controller only performs single, non-blocking
// OS operations on one child.

class ProcessController {
public:
    virtual ~ProcessController() = default;

    [[nodiscard]] virtual Result<ChildProcess> spawn(const ValidatedCommand& command,
                                                     const SpawnOptions& options) = 0;

    /// Signals the whole group. Never blocks.
    virtual void terminate(const ProcessHandle& handle, StopMode mode) = 0;

    /// Non-blocking exit check; collects the exit status when the child has exited.
    [[nodiscard]] virtual ReapStatus reap(const ProcessHandle& handle) = 0;

    /// Frees OS resources held for an exited child.
    virtual void release(ProcessHandle& handle) noexcept = 0;

    [[nodiscard]] virtual std::string_view platform_name() const noexcept = 0;
};

/// Controller for the platform this library was built for.
[[nodiscard]] std::unique_ptr<ProcessController> make_platform_process_controller();

}  // namespace mcpc
