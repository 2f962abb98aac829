#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────
// Inbound bytes (process stdout, SSE data, HTTP bodies) are parsed with
// simdjson and converted into nlohmann::json, which is what the rest of the
// library manipulates and serializes.

#include "mcpc/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcpc {

using Json = nlohmann::json;

/// Nesting deeper than this is rejected rather than recursed into.
inline constexpr std::size_t kMaxJsonDepth = 64;

/// Parses `text` into Json. Failures are reported as Protocol errors whose
/// evidence holds the (truncated) input.
[[nodiscard]] Result<Json> parse_json(std::string_view text);

/// True when `text` starts like a JSON object after leading whitespace; a cheap
/// test used before attempting a full parse of a stdout line.
[[nodiscard]] bool looks_like_json_object(std::string_view text) noexcept;

/// Shortens `text` to at most `limit` bytes, appending "..." when cut.
[[nodiscard]] std::string excerpt(std::string_view text, std::size_t limit = 200);

}  // namespace mcpc
