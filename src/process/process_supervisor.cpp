#include "mcpc/process/process_supervisor.hpp"

#include "mcpc/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/thread_pool.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>

namespace mcpc {

bool is_valid_transition(ProcessState from, ProcessState to) noexcept {
    switch (from) {
        case ProcessState::Unspawned:
            return to == ProcessState::Running;
        case ProcessState::Running:
            return to == ProcessState::Terminating || to == ProcessState::Exited;
        case ProcessState::Terminating:
            return to == ProcessState::Exited;
        case ProcessState::Exited:
            return false;
    }
    return false;
}

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config)
    : ProcessSupervisor(make_platform_process_controller(), config)
{}

ProcessSupervisor::ProcessSupervisor(std::unique_ptr<ProcessController> controller,
                                     SupervisorConfig config)
    : controller_(std::move(controller))
    , config_(config)
    , reap_timer_(io_)
{
    asio::co_spawn(io_, reaper_loop(), asio::detached);
    reaper_thread_ = std::thread([this] { io_.run(); });
    get_logger().debug_fmt("Process supervisor started ({} controller)", controller_->platform_name());
}

ProcessSupervisor::~ProcessSupervisor() {
    stopping_ = true;
    asio::post(io_, [this] { reap_timer_.cancel(); });
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }
    kill_all();
}

// ─────────────────────────────────────────────────────────────────────────────
// Spawn
// ─────────────────────────────────────────────────────────────────────────────

Result<SpawnedProcess> ProcessSupervisor::spawn(const ValidatedCommand& command,
                                                const SpawnOptions& options) {
    auto entry = std::make_shared<Entry>();

    auto child = controller_->spawn(command, options);
    if (child.has_value() == false) {
        get_logger().error_fmt("Spawn failed: {}", child.error().message);
        return tl::unexpected(std::move(child.error()));
    }

    entry->handle = child->handle;
    set_state(*entry, ProcessState::Running);

    ProcessId id = 0;
    {
        std::lock_guard lock(table_mutex_);
        id = next_id_++;
        entry->id = id;
        table_.emplace(id, entry);
    }

    get_logger().info_fmt("Started process {} (pid {}): {}", id, child->handle.pid, command.display());

    SpawnedProcess spawned;
    spawned.id = id;
    spawned.pid = child->handle.pid;
    spawned.pipes = std::move(child->pipes);
    return spawned;
}

// ─────────────────────────────────────────────────────────────────────────────
// Terminate
// ─────────────────────────────────────────────────────────────────────────────

TerminateResult ProcessSupervisor::terminate(ProcessId id) {
    auto entry = find(id);
    if (entry == nullptr) {
        if (auto code = exit_status(id)) {
            return TerminateResult{TerminateOutcome::AlreadyExited, code, false};
        }
        return TerminateResult{};
    }

    // Another terminate() owns this process; wait for it to finish instead of
    // signalling twice.
    const auto bound = std::chrono::steady_clock::now() + config_.grace_window + config_.force_window;
    for (;;) {
        std::unique_lock lock(entry->mutex);
        if (entry->terminate_active == false) {
            break;
        }
        lock.unlock();
        if (std::chrono::steady_clock::now() >= bound) {
            return TerminateResult{TerminateOutcome::GaveUp, std::nullopt, false};
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }

    ProcessHandle handle;
    bool already_exited = false;
    std::optional<int> early_code;
    {
        std::lock_guard lock(entry->mutex);
        already_exited = poll_exit_locked(*entry);
        if (already_exited) {
            early_code = entry->exit_code;
        } else {
            if (entry->state == ProcessState::Running) {
                set_state(*entry, ProcessState::Terminating);
            }
            entry->terminate_active = true;
            handle = entry->handle;
        }
    }
    if (already_exited) {
        untrack(id, early_code);
        return TerminateResult{TerminateOutcome::AlreadyExited, early_code, false};
    }

    auto wait_window = [&](std::chrono::milliseconds window) -> bool {
        const auto deadline = std::chrono::steady_clock::now() + window;
        for (;;) {
            {
                std::lock_guard lock(entry->mutex);
                if (poll_exit_locked(*entry)) {
                    return true;
                }
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(config_.poll_interval);
        }
    };

    get_logger().debug_fmt("Stopping process {} (pid {})", id, handle.pid);
    controller_->terminate(handle, StopMode::Graceful);

    bool forced = false;
    bool exited = wait_window(config_.grace_window);
    if (exited == false) {
        get_logger().warn_fmt("Process {} (pid {}) ignored graceful stop; killing group", id, handle.pid);
        controller_->terminate(handle, StopMode::Force);
        forced = true;
        exited = wait_window(config_.force_window);
    }

    if (exited) {
        std::optional<int> code;
        {
            std::lock_guard lock(entry->mutex);
            code = entry->exit_code;
            entry->terminate_active = false;
        }
        untrack(id, code);
        get_logger().info_fmt("Process {} terminated (exit {})", id, code.value_or(-1));
        return TerminateResult{TerminateOutcome::Exited, code, forced};
    }

    {
        std::lock_guard lock(entry->mutex);
        entry->terminate_active = false;
    }
    get_logger().warn_fmt("Process {} (pid {}) did not report exit; leaving it to the reaper", id, handle.pid);
    return TerminateResult{TerminateOutcome::GaveUp, std::nullopt, forced};
}

void ProcessSupervisor::kill_all() {
    std::vector<ProcessId> ids;
    {
        std::lock_guard lock(table_mutex_);
        ids.reserve(table_.size());
        for (const auto& [id, entry] : table_) {
            ids.push_back(id);
        }
    }
    if (ids.empty()) {
        return;
    }

    get_logger().info_fmt("Terminating {} tracked process(es)", ids.size());

    asio::thread_pool pool(std::min<std::size_t>(ids.size(), 16));
    for (const ProcessId id : ids) {
        asio::post(pool, [this, id] {
            const auto result = terminate(id);
            if (result.outcome == TerminateOutcome::GaveUp) {
                get_logger().error_fmt("Process {} survived kill_all", id);
            }
        });
    }
    pool.join();
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::optional<ProcessState> ProcessSupervisor::state(ProcessId id) const {
    auto entry = find(id);
    if (entry == nullptr) {
        return std::nullopt;
    }
    std::lock_guard lock(entry->mutex);
    return entry->state;
}

std::size_t ProcessSupervisor::tracked_count() const {
    std::lock_guard lock(table_mutex_);
    return table_.size();
}

std::optional<int> ProcessSupervisor::exit_status(ProcessId id) const {
    if (auto entry = find(id)) {
        std::lock_guard lock(entry->mutex);
        return entry->exit_code;
    }

    std::lock_guard lock(table_mutex_);
    const auto it = std::find_if(finished_.begin(), finished_.end(),
                                 [id](const auto& item) { return item.first == id; });
    if (it == finished_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> ProcessSupervisor::wait_for_exit(ProcessId id, std::chrono::milliseconds window) {
    const auto deadline = std::chrono::steady_clock::now() + window;
    for (;;) {
        auto entry = find(id);
        if (entry == nullptr) {
            return exit_status(id);
        }

        std::optional<int> code;
        bool exited = false;
        {
            std::lock_guard lock(entry->mutex);
            if (entry->terminate_active == false) {
                exited = poll_exit_locked(*entry);
                code = entry->exit_code;
            }
        }
        if (exited) {
            untrack(id, code);
            return code;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Reaping
// ─────────────────────────────────────────────────────────────────────────────

void ProcessSupervisor::reap_now() {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard lock(table_mutex_);
        snapshot.reserve(table_.size());
        for (const auto& [id, entry] : table_) {
            snapshot.push_back(entry);
        }
    }

    std::vector<std::pair<ProcessId, std::optional<int>>> exited;
    for (const auto& entry : snapshot) {
        std::lock_guard lock(entry->mutex);
        // An explicit terminate owns the process until it returns.
        if (entry->terminate_active) {
            continue;
        }
        if (poll_exit_locked(*entry)) {
            exited.emplace_back(entry->id, entry->exit_code);
        }
    }

    for (const auto& [id, code] : exited) {
        get_logger().info_fmt("Reaped process {} (exit {})", id, code.value_or(-1));
        untrack(id, code);
    }
}

asio::awaitable<void> ProcessSupervisor::reaper_loop() {
    while (stopping_ == false) {
        reap_timer_.expires_after(config_.reap_interval);
        asio::error_code ec;
        co_await reap_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || stopping_) {
            break;
        }
        reap_now();
    }
}

bool ProcessSupervisor::poll_exit_locked(Entry& entry) {
    if (entry.state == ProcessState::Exited) {
        return true;
    }

    const auto status = controller_->reap(entry.handle);
    if (status.state == ReapStatus::State::Running) {
        return false;
    }
    if (status.state == ReapStatus::State::Lost) {
        get_logger().warn_fmt("Process {} was collected elsewhere; exit code unknown", entry.id);
    }

    entry.exit_code = status.exit_code;
    set_state(entry, ProcessState::Exited);
    controller_->release(entry.handle);
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal Helpers
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<ProcessSupervisor::Entry> ProcessSupervisor::find(ProcessId id) const {
    std::lock_guard lock(table_mutex_);
    const auto it = table_.find(id);
    if (it == table_.end()) {
        return nullptr;
    }
    return it->second;
}

void ProcessSupervisor::set_state(Entry& entry, ProcessState next) {
    if (is_valid_transition(entry.state, next) == false) {
        get_logger().error_fmt("Ignoring invalid process transition {} -> {}",
                               to_string(entry.state), to_string(next));
        return;
    }
    get_logger().trace_fmt("Process {}: {} -> {}", entry.id, to_string(entry.state), to_string(next));
    entry.state = next;
}

void ProcessSupervisor::untrack(ProcessId id, std::optional<int> exit_code) {
    std::lock_guard lock(table_mutex_);
    if (table_.erase(id) == 0) {
        return;
    }
    finished_.emplace_back(id, exit_code.value_or(-1));
    while (finished_.size() > config_.remembered_exits) {
        finished_.pop_front();
    }
}

}  // namespace mcpc
