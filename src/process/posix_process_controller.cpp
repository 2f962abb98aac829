#include "posix_process_controller.hpp"

#include "mcpc/log/logger.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpc::detail {

namespace {

#if defined(__linux__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define MCPC_HAVE_PIPE2 1
#else
#define MCPC_HAVE_PIPE2 0
#endif

#if MCPC_HAVE_PIPE2 == 0
// Held from pipe() until fork() returns so a concurrent spawn cannot fork
// while our descriptors are still inheritable.
std::mutex& descriptor_mutex() {
    static std::mutex mutex;
    return mutex;
}
#endif

// Both ends close-on-exec; the child's ends are dup2'ed onto 0/1/2, which
// clears the flag on the duplicates.
[[nodiscard]] bool make_pipe(std::array<int, 2>& fds) {
#if MCPC_HAVE_PIPE2
    return ::pipe2(fds.data(), O_CLOEXEC) == 0;
#else
    if (::pipe(fds.data()) == -1) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_pair(std::array<int, 2>& fds) noexcept {
    for (int& fd : fds) {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
}

[[nodiscard]] int decode_wait_status(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Inherited environment with overrides applied, as "KEY=VALUE" strings.
[[nodiscard]] std::vector<std::string> merged_environment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string_view kv(*entry);
        const auto eq = kv.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        merged.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

}  // namespace

PosixProcessController::PosixProcessController() {
    // A server that dies while we write its stdin must surface as EPIPE, not
    // kill the client.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] {
        struct sigaction action{};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        ::sigaction(SIGPIPE, &action, nullptr);
    });
}

Result<ChildProcess> PosixProcessController::spawn(const ValidatedCommand& command,
                                                   const SpawnOptions& options) {
    // Pre-allocate everything the child needs BEFORE fork(). Only the forking
    // thread survives in the child; if another thread held the malloc lock at
    // fork time, any allocation there deadlocks.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(command.args().size() + 1);
    argv_storage.push_back(command.command());
    for (const auto& arg : command.args()) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& s : argv_storage) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    const bool custom_env = (options.env.empty() == false);
    if (custom_env) {
        env_storage = merged_environment(options.env);
        envp.reserve(env_storage.size() + 1);
        for (auto& s : env_storage) {
            envp.push_back(s.data());
        }
        envp.push_back(nullptr);
    }
    const char* workdir = options.working_directory.empty()
        ? nullptr
        : options.working_directory.c_str();

    std::array<int, 2> in_pipe{-1, -1};
    std::array<int, 2> out_pipe{-1, -1};
    std::array<int, 2> err_pipe{-1, -1};
    std::array<int, 2> exec_status{-1, -1};  // child reports exec errno here

#if MCPC_HAVE_PIPE2 == 0
    std::unique_lock fd_lock(descriptor_mutex());
#endif
    const bool pipes_ok = make_pipe(in_pipe) && make_pipe(out_pipe) &&
                          make_pipe(err_pipe) && make_pipe(exec_status);
    if (pipes_ok == false) {
        const int saved = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_status);
        return tl::unexpected(Error::process_spawn(
            std::format("Failed to create pipes: {}", std::strerror(saved))));
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int saved = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_status);
        return tl::unexpected(Error::process_spawn(
            std::format("Failed to fork: {}", std::strerror(saved))));
    }

    if (pid == 0) {
        // Child - async-signal-safe calls only.
        ::setpgid(0, 0);

        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        // Default SIGPIPE for the server, whatever the parent installed.
        ::signal(SIGPIPE, SIG_DFL);

        if (workdir != nullptr && ::chdir(workdir) == -1) {
            const int err = errno;
            (void)!::write(exec_status[1], &err, sizeof(err));
            _exit(127);
        }
        if (custom_env) {
            environ = envp.data();
        }

        ::execvp(argv[0], argv.data());

        const int err = errno;
        (void)!::write(exec_status[1], &err, sizeof(err));
        _exit(127);
    }

#if MCPC_HAVE_PIPE2 == 0
    fd_lock.unlock();
#endif

    // Parent. Set the group here too so signalling works even if we win the
    // race against the child's own setpgid.
    ::setpgid(pid, pid);

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_status[1]);

    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(exec_status[0], &child_errno, sizeof(child_errno));
    } while (got == -1 && errno == EINTR);
    ::close(exec_status[0]);

    if (got > 0) {
        // exec never happened; collect the child so it does not linger.
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        return tl::unexpected(Error::process_spawn(
            std::format("Failed to start '{}': {}", command.command(), std::strerror(child_errno))));
    }

    ChildProcess child;
    child.handle.pid = pid;
    child.handle.group = pid;
    child.pipes.stdin_pipe = Pipe(in_pipe[1]);
    child.pipes.stdout_pipe = Pipe(out_pipe[0]);
    child.pipes.stderr_pipe = Pipe(err_pipe[0]);

    get_logger().debug_fmt("Spawned pid {} in process group {}", pid, pid);
    return child;
}

void PosixProcessController::terminate(const ProcessHandle& handle, StopMode mode) {
    if (handle.group <= 0) {
        return;
    }
    const int sig = (mode == StopMode::Graceful) ? SIGTERM : SIGKILL;
    const auto pgid = static_cast<pid_t>(handle.group);

    if (::kill(-pgid, sig) == -1 && errno != ESRCH) {
        get_logger().warn_fmt("kill(-{}, {}) failed: {}", pgid, sig, std::strerror(errno));
    }
}

ReapStatus PosixProcessController::reap(const ProcessHandle& handle) {
    if (handle.pid <= 0) {
        return ReapStatus{ReapStatus::State::Lost, -1};
    }

    int status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(static_cast<pid_t>(handle.pid), &status, WNOHANG);
    } while (result == -1 && errno == EINTR);

    if (result == 0) {
        return ReapStatus{ReapStatus::State::Running, -1};
    }
    if (result == -1) {
        return ReapStatus{ReapStatus::State::Lost, -1};
    }
    return ReapStatus{ReapStatus::State::Exited, decode_wait_status(status)};
}

void PosixProcessController::release(ProcessHandle& handle) noexcept {
    // Nothing is held once waitpid has collected the child.
    handle.pid = -1;
    handle.group = -1;
}

}  // namespace mcpc::detail
