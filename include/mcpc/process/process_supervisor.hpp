#pragma once

#include "mcpc/error.hpp"
#include "mcpc/process/process_controller.hpp"
#include "mcpc/security/command_validator.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcpc {

using ProcessId = std::uint64_t;

// Unspawned -> Running -> Terminating -> Exited. Running -> Exited when the
// child exits on its own. Terminating is only entered through terminate().
enum class ProcessState {
    Unspawned,
    Running,
    Terminating,
    Exited
};

[[nodiscard]] constexpr std::string_view to_string(ProcessState state) noexcept {
    switch (state) {
        case ProcessState::Unspawned:   return "unspawned";
        case ProcessState::Running:     return "running";
        case ProcessState::Terminating: return "terminating";
        case ProcessState::Exited:      return "exited";
    }
    return "unknown";
}

[[nodiscard]] bool is_valid_transition(ProcessState from, ProcessState to) noexcept;

struct SupervisorConfig {
    std::chrono::milliseconds grace_window{2000};
    std::chrono::milliseconds force_window{1000};
    std::chrono::milliseconds reap_interval{100};
    std::chrono::milliseconds poll_interval{20};  ///< Exit polling inside terminate()
    std::size_t remembered_exits{64};
};

/// What the caller gets back from spawn(): an opaque id and the pipe ends.
/// The process itself stays owned by the supervisor.
struct SpawnedProcess {
    ProcessId id{0};
    std::int64_t pid{-1};
    ProcessPipes pipes;
};

enum class TerminateOutcome {
    Exited,         ///< Exit observed within the grace or force window
    AlreadyExited,  ///< Exit had been observed before the request
    GaveUp,         ///< Still not reported after both windows; left to the reaper
    Unknown         ///< Id was never tracked
};

struct TerminateResult {
    TerminateOutcome outcome{TerminateOutcome::Unknown};
    std::optional<int> exit_code;
    bool forced{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// ProcessSupervisor
// ─────────────────────────────────────────────────────────────────────────────
// Spawns children into their own process group (job object on Windows), keeps
// them in a tracking table and guarantees each one is reaped. A background
// reaper on an asio io_context polls tracked children every reap_interval.
//
// Thread-safety: all public methods may be called from any thread.

class ProcessSupervisor {
public:
    /// Uses the controller for the platform this was built for.
    explicit ProcessSupervisor(SupervisorConfig config = {});

    explicit ProcessSupervisor(std::unique_ptr<ProcessController> controller,
                               SupervisorConfig config = {});

    /// Stops the reaper and kills everything still tracked.
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;
    ProcessSupervisor(ProcessSupervisor&&) = delete;
    ProcessSupervisor& operator=(ProcessSupervisor&&) = delete;

    [[nodiscard]] Result<SpawnedProcess> spawn(const ValidatedCommand& command,
                                               const SpawnOptions& options = {});

    /// Graceful stop to the whole group, then a forced kill after grace_window.
    /// Blocks at most grace_window + force_window.
    TerminateResult terminate(ProcessId id);

    /// Terminates every tracked process in parallel; returns when all are done.
    void kill_all();

    /// nullopt once the process has been untracked.
    [[nodiscard]] std::optional<ProcessState> state(ProcessId id) const;

    [[nodiscard]] std::size_t tracked_count() const;

    /// Exit code of a process whose exit has been observed.
    [[nodiscard]] std::optional<int> exit_status(ProcessId id) const;

    /// Polls for a natural exit for up to `window`. Does not signal the process.
    [[nodiscard]] std::optional<int> wait_for_exit(ProcessId id, std::chrono::milliseconds window);

    /// One synchronous reaper pass.
    void reap_now();

    [[nodiscard]] const SupervisorConfig& config() const noexcept { return config_; }

private:
    struct Entry {
        ProcessId id{0};
        ProcessHandle handle;
        ProcessState state{ProcessState::Unspawned};
        bool terminate_active{false};  // reaper keeps away while set
        std::optional<int> exit_code;
        std::mutex mutex;
    };

    [[nodiscard]] std::shared_ptr<Entry> find(ProcessId id) const;
    void set_state(Entry& entry, ProcessState next);

    // Caller holds entry.mutex. Returns true when the exit has been observed.
    bool poll_exit_locked(Entry& entry);

    void untrack(ProcessId id, std::optional<int> exit_code);

    asio::awaitable<void> reaper_loop();

    std::unique_ptr<ProcessController> controller_;
    SupervisorConfig config_;

    mutable std::mutex table_mutex_;
    std::unordered_map<ProcessId, std::shared_ptr<Entry>> table_;
    std::deque<std::pair<ProcessId, int>> finished_;
    ProcessId next_id_{1};

    std::atomic<bool> stopping_{false};
    asio::io_context io_;
    asio::steady_timer reap_timer_;
    std::thread reaper_thread_;
};

}  // namespace mcpc
