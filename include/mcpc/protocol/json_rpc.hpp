#pragma once

#include "mcpc/error.hpp"
#include "mcpc/json/json.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// JSON-RPC 2.0 envelopes
// ─────────────────────────────────────────────────────────────────────────────
// Only the framing the transports need for correlation: building envelopes,
// telling message types apart and unwrapping results.

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

namespace rpc_code {
inline constexpr int kParseError     = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams  = -32602;
inline constexpr int kInternalError  = -32603;
}  // namespace rpc_code

enum class MessageType {
    Request,       // method + id
    Notification,  // method, no id
    Response,      // id + result|error
    Invalid
};

[[nodiscard]] MessageType classify_message(const Json& message);

[[nodiscard]] Json make_request(std::int64_t id,
                                std::string_view method,
                                std::optional<Json> params = std::nullopt);

[[nodiscard]] Json make_notification(std::string_view method,
                                     std::optional<Json> params = std::nullopt);

[[nodiscard]] Json make_error_response(const Json& id, int code, std::string_view message);

/// Integer id of a request or response. Numeric strings are accepted because
/// some servers echo ids back as strings.
[[nodiscard]] std::optional<std::int64_t> message_id(const Json& message);

/// `result` member of a response, or a Protocol error built from `error`.
[[nodiscard]] Result<Json> extract_result(const Json& response);

/// "method" member, or empty.
[[nodiscard]] std::string_view message_method(const Json& message);

}  // namespace mcpc
