#include "mcpc/error.hpp"

#include <format>

namespace mcpc {

std::string Error::describe() const {
    std::string out;
    if (category == ErrorCategory::StartupFailure) {
        out = std::format("{} ({}): {}", to_string(category), to_string(startup), message);
    } else {
        out = std::format("{}: {}", to_string(category), message);
    }
    if (rpc_code.has_value()) {
        out += std::format(" [rpc {}]", *rpc_code);
    }
    if (http_status.has_value()) {
        out += std::format(" [http {}]", *http_status);
    }
    if (remediation.has_value()) {
        out += "\n  hint: ";
        out += *remediation;
    }
    return out;
}

}  // namespace mcpc
