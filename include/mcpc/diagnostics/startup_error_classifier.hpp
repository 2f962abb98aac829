#pragma once

#include "mcpc/error.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpc {

struct ErrorClassification {
    StartupCategory category{StartupCategory::None};
    std::string evidence;     ///< Matching output line, trimmed
    std::string remediation;

    [[nodiscard]] bool matched() const noexcept { return category != StartupCategory::None; }
};

// ─────────────────────────────────────────────────────────────────────────────
// StartupErrorClassifier
// ─────────────────────────────────────────────────────────────────────────────
// Reads what a stdio server printed before the handshake and decides whether
// the process never became a server (missing configuration, bad arguments,
// missing package or executable) as opposed to a plain protocol failure.
//
// Matchers run in order and the first hit wins. Output that shows the server
// reporting itself ready is never classified.

class StartupErrorClassifier {
public:
    StartupErrorClassifier();

    /// `exit_code` is nullopt while the process is still running.
    [[nodiscard]] ErrorClassification classify(std::optional<int> exit_code,
                                               std::string_view early_output) const;

    /// StartupFailure error for a classification; `command` names the server.
    [[nodiscard]] static Error to_error(const ErrorClassification& classification,
                                        std::string_view command);

private:
    /// Returns the remediation on a hit; `line` is the original, `lower` its
    /// lowercase copy.
    using LineMatcher = std::function<std::optional<std::string>(
        std::string_view line, std::string_view lower, std::optional<int> exit_code)>;

    struct Matcher {
        StartupCategory category;
        LineMatcher match;
    };

    std::vector<Matcher> matchers_;
};

/// Name of the environment variable a line complains about, e.g. "BRAVE_API_KEY"
/// in "Error: BRAVE_API_KEY environment variable is required".
[[nodiscard]] std::optional<std::string> extract_env_var_name(std::string_view line);

}  // namespace mcpc
