#include "win32_process_controller.hpp"

#include "mcpc/log/logger.hpp"

#include <cstring>
#include <format>
#include <map>
#include <string>
#include <vector>

#define WIN32_LEAN_AND_MEAN
#include <windows.h>

namespace mcpc::detail {

namespace {

[[nodiscard]] HANDLE as_handle(std::intptr_t value) noexcept {
    return reinterpret_cast<HANDLE>(value);
}

[[nodiscard]] std::string last_error_text() {
    const DWORD code = ::GetLastError();
    char* buffer = nullptr;
    const DWORD len = ::FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string text = (len > 0 && buffer != nullptr)
        ? std::string(buffer, len)
        : std::format("error {}", code);
    if (buffer != nullptr) {
        ::LocalFree(buffer);
    }
    while (text.empty() == false && (text.back() == '\r' || text.back() == '\n')) {
        text.pop_back();
    }
    return text;
}

// CommandLineToArgvW-compatible quoting.
void append_quoted(std::string& out, const std::string& arg) {
    const bool plain = (arg.empty() == false) &&
                       (arg.find_first_of(" \t\"") == std::string::npos);
    if (plain) {
        out += arg;
        return;
    }
    out += '"';
    std::size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
        } else {
            out.append(backslashes, '\\');
        }
        backslashes = 0;
        out += c;
    }
    out.append(backslashes * 2, '\\');
    out += '"';
}

[[nodiscard]] std::string build_command_line(const ValidatedCommand& command) {
    std::string line;
    append_quoted(line, command.command());
    for (const auto& arg : command.args()) {
        line += ' ';
        append_quoted(line, arg);
    }
    return line;
}

// Double-NUL terminated block for CreateProcessA.
[[nodiscard]] std::vector<char> build_environment_block(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    LPCH inherited = ::GetEnvironmentStringsA();
    if (inherited != nullptr) {
        for (const char* p = inherited; *p != '\0'; p += std::strlen(p) + 1) {
            const std::string_view kv(p);
            const auto eq = kv.find('=', 1);  // "=C:=C:\\" entries start with '='
            if (eq == std::string_view::npos) {
                continue;
            }
            merged.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
        }
        ::FreeEnvironmentStringsA(inherited);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<char> block;
    for (const auto& [key, value] : merged) {
        block.insert(block.end(), key.begin(), key.end());
        block.push_back('=');
        block.insert(block.end(), value.begin(), value.end());
        block.push_back('\0');
    }
    block.push_back('\0');
    return block;
}

struct PipePair {
    HANDLE read{nullptr};
    HANDLE write{nullptr};

    void close() noexcept {
        if (read != nullptr) { ::CloseHandle(read); read = nullptr; }
        if (write != nullptr) { ::CloseHandle(write); write = nullptr; }
    }
};

// `parent_end_is_read` selects which end stays in the parent (non-inheritable).
[[nodiscard]] bool make_pipe(PipePair& pair, bool parent_end_is_read) {
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    if (::CreatePipe(&pair.read, &pair.write, &sa, 0) == FALSE) {
        return false;
    }
    HANDLE parent_end = parent_end_is_read ? pair.read : pair.write;
    return ::SetHandleInformation(parent_end, HANDLE_FLAG_INHERIT, 0) != FALSE;
}

}  // namespace

Result<ChildProcess> Win32ProcessController::spawn(const ValidatedCommand& command,
                                                   const SpawnOptions& options) {
    PipePair in_pipe;
    PipePair out_pipe;
    PipePair err_pipe;
    const bool pipes_ok = make_pipe(in_pipe, false) && make_pipe(out_pipe, true) &&
                          make_pipe(err_pipe, true);
    if (pipes_ok == false) {
        auto err = Error::process_spawn(std::format("Failed to create pipes: {}", last_error_text()));
        in_pipe.close();
        out_pipe.close();
        err_pipe.close();
        return tl::unexpected(std::move(err));
    }

    HANDLE job = ::CreateJobObjectA(nullptr, nullptr);
    if (job == nullptr) {
        auto err = Error::process_spawn(std::format("CreateJobObject failed: {}", last_error_text()));
        in_pipe.close();
        out_pipe.close();
        err_pipe.close();
        return tl::unexpected(std::move(err));
    }

    // Closing the job handle kills everything left in it, so a crashed client
    // cannot orphan servers.
    JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
    limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
    ::SetInformationJobObject(job, JobObjectExtendedLimitInformation, &limits, sizeof(limits));

    STARTUPINFOA startup{};
    startup.cb = sizeof(startup);
    startup.dwFlags = STARTF_USESTDHANDLES;
    startup.hStdInput = in_pipe.read;
    startup.hStdOutput = out_pipe.write;
    startup.hStdError = err_pipe.write;

    std::string command_line = build_command_line(command);
    std::vector<char> env_block;
    if (options.env.empty() == false) {
        env_block = build_environment_block(options.env);
    }

    PROCESS_INFORMATION info{};
    const DWORD flags = CREATE_SUSPENDED | CREATE_NEW_PROCESS_GROUP | CREATE_NO_WINDOW;
    const BOOL created = ::CreateProcessA(
        nullptr,
        command_line.data(),
        nullptr,
        nullptr,
        TRUE,
        flags,
        env_block.empty() ? nullptr : env_block.data(),
        options.working_directory.empty() ? nullptr : options.working_directory.c_str(),
        &startup,
        &info);

    if (created == FALSE) {
        auto err = Error::process_spawn(
            std::format("Failed to start '{}': {}", command.command(), last_error_text()));
        ::CloseHandle(job);
        in_pipe.close();
        out_pipe.close();
        err_pipe.close();
        return tl::unexpected(std::move(err));
    }

    if (::AssignProcessToJobObject(job, info.hProcess) == FALSE) {
        get_logger().warn_fmt("AssignProcessToJobObject failed for pid {}: {}",
                              info.dwProcessId, last_error_text());
    }
    ::ResumeThread(info.hThread);
    ::CloseHandle(info.hThread);

    // Child-side ends belong to the child now.
    ::CloseHandle(in_pipe.read);
    ::CloseHandle(out_pipe.write);
    ::CloseHandle(err_pipe.write);

    ChildProcess child;
    child.handle.pid = static_cast<std::int64_t>(info.dwProcessId);
    child.handle.group = reinterpret_cast<std::intptr_t>(job);
    child.handle.process = reinterpret_cast<std::intptr_t>(info.hProcess);
    child.pipes.stdin_pipe = Pipe(in_pipe.write);
    child.pipes.stdout_pipe = Pipe(out_pipe.read);
    child.pipes.stderr_pipe = Pipe(err_pipe.read);

    get_logger().debug_fmt("Spawned pid {} in job object", info.dwProcessId);
    return child;
}

void Win32ProcessController::terminate(const ProcessHandle& handle, StopMode mode) {
    if (mode == StopMode::Graceful) {
        // Delivered to the child's process group (CREATE_NEW_PROCESS_GROUP).
        if (::GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, static_cast<DWORD>(handle.pid)) == FALSE) {
            get_logger().debug_fmt("CTRL_BREAK to pid {} failed: {}", handle.pid, last_error_text());
        }
        return;
    }

    if (handle.group != -1 && handle.group != 0) {
        if (::TerminateJobObject(as_handle(handle.group), 1) == FALSE) {
            get_logger().warn_fmt("TerminateJobObject failed: {}", last_error_text());
        }
    } else if (handle.process != -1 && handle.process != 0) {
        ::TerminateProcess(as_handle(handle.process), 1);
    }
}

ReapStatus Win32ProcessController::reap(const ProcessHandle& handle) {
    if (handle.process == -1 || handle.process == 0) {
        return ReapStatus{ReapStatus::State::Lost, -1};
    }

    const DWORD wait = ::WaitForSingleObject(as_handle(handle.process), 0);
    if (wait == WAIT_TIMEOUT) {
        return ReapStatus{ReapStatus::State::Running, -1};
    }
    if (wait != WAIT_OBJECT_0) {
        return ReapStatus{ReapStatus::State::Lost, -1};
    }

    DWORD code = 0;
    if (::GetExitCodeProcess(as_handle(handle.process), &code) == FALSE) {
        return ReapStatus{ReapStatus::State::Exited, -1};
    }
    return ReapStatus{ReapStatus::State::Exited, static_cast<int>(code)};
}

void Win32ProcessController::release(ProcessHandle& handle) noexcept {
    if (handle.process != -1 && handle.process != 0) {
        ::CloseHandle(as_handle(handle.process));
    }
    if (handle.group != -1 && handle.group != 0) {
        ::CloseHandle(as_handle(handle.group));
    }
    handle.process = -1;
    handle.group = -1;
    handle.pid = -1;
}

}  // namespace mcpc::detail
