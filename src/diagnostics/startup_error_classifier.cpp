#include "mcpc/diagnostics/startup_error_classifier.hpp"

#include "mcpc/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <span>

namespace mcpc {

namespace {

constexpr std::size_t kEvidenceLimit = 200;

constexpr std::array<std::string_view, 7> kReadyPatterns{
    "server running",
    "server started",
    "listening on stdio",
    "running on stdio",
    "ready for connections",
    "initialized successfully",
    "server is ready",
};

constexpr std::array<std::string_view, 9> kPackagePatterns{
    "npm error 404",
    "npm err! 404",
    "package not found",
    "is not in this registry",
    "is not in the npm registry",
    "cannot find module",
    "module not found",
    "no module named",
    "no matching distribution found",
};

constexpr std::array<std::string_view, 6> kGenericMarkers{
    "error", "exception", "traceback", "fatal", "panic", "permission denied",
};

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool contains_any(std::string_view text, std::span<const std::string_view> needles) {
    return std::ranges::any_of(needles, [text](std::string_view needle) {
        return text.find(needle) != std::string_view::npos;
    });
}

bool nonzero(std::optional<int> exit_code) {
    return exit_code.has_value() && *exit_code != 0;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    while (text.empty() == false) {
        const auto nl = text.find('\n');
        auto line = trim(text.substr(0, nl));
        if (line.empty() == false) {
            lines.push_back(line);
        }
        if (nl == std::string_view::npos) {
            break;
        }
        text.remove_prefix(nl + 1);
    }
    return lines;
}

bool is_env_token(std::string_view token) {
    if (token.empty() || std::isdigit(static_cast<unsigned char>(token.front()))) {
        return false;
    }
    bool has_upper = false;
    for (const char c : token) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::islower(uc)) {
            return false;
        }
        has_upper = has_upper || std::isupper(uc);
    }
    return has_upper;
}

}  // namespace

std::optional<std::string> extract_env_var_name(std::string_view line) {
    // Shouting prefixes are not variable names.
    static constexpr std::array<std::string_view, 5> kNotNames{"ERROR", "FATAL", "WARN", "WARNING", "ERR"};

    std::optional<std::string> fallback;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) == 0 && line[i] != '_')) {
            ++i;
        }
        const auto start = i;
        while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) != 0 || line[i] == '_')) {
            ++i;
        }
        const auto token = line.substr(start, i - start);
        if (is_env_token(token) == false || std::ranges::find(kNotNames, token) != kNotNames.end()) {
            continue;
        }
        // NAME_WITH_UNDERSCORES is the usual shape; take it over a bare word.
        if (token.find('_') != std::string_view::npos) {
            return std::string(token);
        }
        if (fallback.has_value() == false) {
            fallback = std::string(token);
        }
    }
    return fallback;
}

StartupErrorClassifier::StartupErrorClassifier() {
    matchers_.push_back({StartupCategory::MissingEnvVar,
        [](std::string_view line, std::string_view lower, std::optional<int>) -> std::optional<std::string> {
            const bool mentions_env = lower.find("environment variable") != std::string_view::npos ||
                                      lower.find("env var") != std::string_view::npos;
            const bool missing = lower.find("required") != std::string_view::npos ||
                                 lower.find("missing") != std::string_view::npos ||
                                 lower.find("not set") != std::string_view::npos;
            if (mentions_env == false || missing == false) {
                return std::nullopt;
            }
            if (auto name = extract_env_var_name(line); name.has_value()) {
                return std::format("Set the {} environment variable before starting the server", *name);
            }
            return std::string("Set the environment variables the server requires before starting it");
        }});

    matchers_.push_back({StartupCategory::UsageError,
        [](std::string_view, std::string_view lower, std::optional<int>) -> std::optional<std::string> {
            if (lower.starts_with("usage:") || lower.find(" usage: ") != std::string_view::npos ||
                lower.starts_with("error: missing")) {
                return std::string("The server rejected its arguments; check the arguments in the server configuration");
            }
            return std::nullopt;
        }});

    matchers_.push_back({StartupCategory::PackageNotFound,
        [](std::string_view, std::string_view lower, std::optional<int>) -> std::optional<std::string> {
            if (contains_any(lower, kPackagePatterns)) {
                return std::string("Install the missing package (npm install / pip install) or check the package name");
            }
            return std::nullopt;
        }});

    matchers_.push_back({StartupCategory::CommandNotFound,
        [](std::string_view, std::string_view lower, std::optional<int> exit_code) -> std::optional<std::string> {
            if (nonzero(exit_code) == false) {
                return std::nullopt;
            }
            const bool os_error = lower.find("command not found") != std::string_view::npos ||
                                  lower.find("executable file not found") != std::string_view::npos ||
                                  lower.find("is not recognized as an internal or external command") != std::string_view::npos;
            const bool shell_127 = *exit_code == 127 && lower.find("not found") != std::string_view::npos;
            if (os_error || shell_127) {
                return std::string("Install the command or give its full path");
            }
            return std::nullopt;
        }});

    matchers_.push_back({StartupCategory::Generic,
        [](std::string_view, std::string_view lower, std::optional<int> exit_code) -> std::optional<std::string> {
            if (nonzero(exit_code) == false || contains_any(lower, kGenericMarkers) == false) {
                return std::nullopt;
            }
            if (lower.find("permission denied") != std::string_view::npos) {
                return std::string("Check that the server executable and its files are readable and executable");
            }
            return std::string("The server exited during startup; see the output above for details");
        }});
}

ErrorClassification StartupErrorClassifier::classify(std::optional<int> exit_code,
                                                     std::string_view early_output) const {
    const auto lines = split_lines(early_output);
    if (lines.empty()) {
        return {};
    }

    std::vector<std::string> lowered;
    lowered.reserve(lines.size());
    for (const auto line : lines) {
        lowered.push_back(to_lower(line));
    }

    for (const auto& lower : lowered) {
        if (contains_any(lower, kReadyPatterns)) {
            MCPC_LOG_DEBUG("Server reported ready; not a startup failure");
            return {};
        }
    }

    for (const auto& matcher : matchers_) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            auto remediation = matcher.match(lines[i], lowered[i], exit_code);
            if (remediation.has_value() == false) {
                continue;
            }
            get_logger().debug_fmt("Startup output classified as {}", to_string(matcher.category));
            return ErrorClassification{
                matcher.category,
                std::string(lines[i].substr(0, kEvidenceLimit)),
                std::move(*remediation),
            };
        }
    }
    return {};
}

Error StartupErrorClassifier::to_error(const ErrorClassification& classification, std::string_view command) {
    std::string message;
    switch (classification.category) {
        case StartupCategory::MissingEnvVar:
            if (auto name = extract_env_var_name(classification.evidence); name.has_value()) {
                message = std::format("'{}' needs the {} environment variable", command, *name);
            } else {
                message = std::format("'{}' is missing a required environment variable", command);
            }
            break;
        case StartupCategory::UsageError:
            message = std::format("'{}' was started with invalid arguments", command);
            break;
        case StartupCategory::PackageNotFound:
            message = std::format("'{}' could not find its package", command);
            break;
        case StartupCategory::CommandNotFound:
            message = std::format("'{}' could not be found", command);
            break;
        case StartupCategory::Generic:
        case StartupCategory::None:
            message = std::format("'{}' failed during startup", command);
            break;
    }
    return Error::startup_failure(classification.category, std::move(message),
                                  classification.evidence, classification.remediation);
}

}  // namespace mcpc
