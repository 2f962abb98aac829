#pragma once

#include "mcpc/json/json.hpp"

namespace mcpc {

/// Adjusts `arguments` against a tool's JSON Schema before a tools/call:
/// an empty (or null) array for a property listed in `required` is sent as
/// `[]`; for any other property it is left out.
[[nodiscard]] Json shape_tool_arguments(const Json& input_schema, Json arguments);

}  // namespace mcpc
