#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Every protocol message
    Debug = 1,  // State transitions, classifier verdicts
    Info  = 2,  // Process and transport lifecycle
    Warn  = 3,  // Forced kills, dropped messages
    Error = 4,  // Operation failed
    Off   = 5
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

// Accepts the names produced by to_string() plus "warning" and "err".
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    // Formatting helpers; the argument list is only formatted when the level is enabled.
    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Trace)) {
            log(LogRecord(LogLevel::Trace, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global logger
// ─────────────────────────────────────────────────────────────────────────────
// The library never installs a logger itself; hosts call set_logger() once at
// startup. Until then every record is discarded.

[[nodiscard]] ILogger& get_logger() noexcept;

// Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define MCPC_LOG_TRACE(msg) \
    do { if (::mcpc::get_logger().should_log(::mcpc::LogLevel::Trace)) \
         ::mcpc::get_logger().trace(msg); } while(false)

#define MCPC_LOG_DEBUG(msg) \
    do { if (::mcpc::get_logger().should_log(::mcpc::LogLevel::Debug)) \
         ::mcpc::get_logger().debug(msg); } while(false)

#define MCPC_LOG_INFO(msg) \
    do { if (::mcpc::get_logger().should_log(::mcpc::LogLevel::Info)) \
         ::mcpc::get_logger().info(msg); } while(false)

#define MCPC_LOG_WARN(msg) \
    do { if (::mcpc::get_logger().should_log(::mcpc::LogLevel::Warn)) \
         ::mcpc::get_logger().warn(msg); } while(false)

#define MCPC_LOG_ERROR(msg) \
    do { if (::mcpc::get_logger().should_log(::mcpc::LogLevel::Error)) \
         ::mcpc::get_logger().error(msg); } while(false)

}  // namespace mcpc
