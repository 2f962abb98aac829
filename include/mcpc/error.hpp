#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// mcpc Error
// ═══════════════════════════════════════════════════════════════════════════
// Single error type surfaced by every public operation. The presentation layer
// renders `message` and, when present, `remediation`; `evidence` carries the
// raw excerpt (process output, response body) the error was derived from.

#include <tl/expected.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcpc {

enum class ErrorCategory {
    Validation,      ///< Command rejected before spawn
    ProcessSpawn,    ///< OS failed to start the executable
    StartupFailure,  ///< Process started but never became a valid server
    Transport,       ///< Network or stream failure (event-stream, http)
    Protocol,        ///< Handshake or request/response failure
    NotConnected     ///< Operation attempted outside the Connected state
};

inline constexpr std::size_t kErrorCategoryCount = 6;

[[nodiscard]] constexpr std::string_view to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Validation:     return "ValidationError";
        case ErrorCategory::ProcessSpawn:   return "ProcessSpawnError";
        case ErrorCategory::StartupFailure: return "StartupFailureError";
        case ErrorCategory::Transport:      return "TransportError";
        case ErrorCategory::Protocol:       return "ProtocolError";
        case ErrorCategory::NotConnected:   return "NotConnectedError";
    }
    return "UnknownError";
}

/// Classification of a failed server start.
enum class StartupCategory {
    None,
    MissingEnvVar,
    UsageError,
    PackageNotFound,
    CommandNotFound,
    Generic
};

inline constexpr std::size_t kStartupCategoryCount = 6;

[[nodiscard]] constexpr std::string_view to_string(StartupCategory category) noexcept {
    switch (category) {
        case StartupCategory::None:            return "None";
        case StartupCategory::MissingEnvVar:   return "MissingEnvVar";
        case StartupCategory::UsageError:      return "UsageError";
        case StartupCategory::PackageNotFound: return "PackageNotFound";
        case StartupCategory::CommandNotFound: return "CommandNotFound";
        case StartupCategory::Generic:         return "Generic";
    }
    return "Unknown";
}

struct Error {
    ErrorCategory category{ErrorCategory::Protocol};
    std::string message;
    std::optional<std::string> evidence;
    std::optional<std::string> remediation;
    StartupCategory startup{StartupCategory::None};  ///< Only meaningful for StartupFailure
    std::optional<int> rpc_code;                     ///< JSON-RPC error code from the server
    std::optional<int> http_status;

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error validation(std::string msg, std::string offending_token) {
        Error err{ErrorCategory::Validation, std::move(msg)};
        err.evidence = std::move(offending_token);
        err.remediation = "Remove shell metacharacters and path traversal from the server command";
        return err;
    }

    [[nodiscard]] static Error process_spawn(std::string msg) {
        Error err{ErrorCategory::ProcessSpawn, std::move(msg)};
        err.remediation = "Check that the command is installed and executable";
        return err;
    }

    [[nodiscard]] static Error startup_failure(StartupCategory kind,
                                               std::string msg,
                                               std::string evidence,
                                               std::string remediation) {
        Error err{ErrorCategory::StartupFailure, std::move(msg)};
        err.startup = kind;
        err.evidence = std::move(evidence);
        err.remediation = std::move(remediation);
        return err;
    }

    [[nodiscard]] static Error transport(std::string msg,
                                         std::optional<int> status = std::nullopt) {
        Error err{ErrorCategory::Transport, std::move(msg)};
        err.http_status = status;
        return err;
    }

    [[nodiscard]] static Error protocol(std::string msg) {
        return Error{ErrorCategory::Protocol, std::move(msg)};
    }

    [[nodiscard]] static Error rpc(int code, std::string msg) {
        Error err{ErrorCategory::Protocol, std::move(msg)};
        err.rpc_code = code;
        return err;
    }

    [[nodiscard]] static Error not_connected() {
        return Error{ErrorCategory::NotConnected, "Not connected to a server"};
    }

    Error& with_evidence(std::string excerpt) & {
        evidence = std::move(excerpt);
        return *this;
    }

    Error&& with_evidence(std::string excerpt) && {
        evidence = std::move(excerpt);
        return std::move(*this);
    }

    /// "<Category>: message" plus the remediation on its own line, when present.
    [[nodiscard]] std::string describe() const;
};

/// Transient transport and protocol failures may be retried by the caller.
/// Validation, spawn and startup failures need a configuration change.
[[nodiscard]] constexpr bool is_retryable(const Error& err) noexcept {
    return err.category == ErrorCategory::Transport ||
           err.category == ErrorCategory::Protocol;
}

template <typename T>
using Result = tl::expected<T, Error>;

using Status = tl::expected<void, Error>;

}  // namespace mcpc
