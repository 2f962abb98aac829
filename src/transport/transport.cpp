#include "mcpc/transport/transport.hpp"

namespace mcpc {

std::optional<TransportKind> parse_transport_kind(std::string_view name) {
    if (name == "stdio") {
        return TransportKind::Stdio;
    }
    if (name == "event-stream" || name == "sse") {
        return TransportKind::EventStream;
    }
    if (name == "http" || name == "streamable-http") {
        return TransportKind::Http;
    }
    return std::nullopt;
}

}  // namespace mcpc
