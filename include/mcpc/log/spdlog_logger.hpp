#pragma once

#include "mcpc/log/logger.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Output goes to stderr by default. stdout is left alone because the CLI
// prints operation results there.

class SpdlogLogger final : public ILogger {
public:
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;
    SpdlogLogger(SpdlogLogger&&) noexcept = default;
    SpdlogLogger& operator=(SpdlogLogger&&) noexcept = default;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_stderr_logger(
    LogLevel min_level = LogLevel::Info
);

/// Rotating file log, optionally mirrored to stderr.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_rotating_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info,
    bool mirror_to_stderr = false,
    std::size_t max_file_size = 5 * 1024 * 1024,
    std::size_t max_files = 3
);

}  // namespace mcpc
