#include "mcpc/transport/http_client.hpp"

#include <ada.h>

#include <format>

namespace mcpc {

Error HttpClientError::to_error() const {
    switch (code) {
        case Code::Timeout:
            return Error::transport("HTTP request timed out: " + message);
        case Code::SslError:
            return Error::transport("TLS failure: " + message);
        case Code::Cancelled:
            return Error::transport("HTTP request cancelled");
        case Code::ConnectionFailed:
            return Error::transport("Connection failed: " + message);
        case Code::Unknown:
            break;
    }
    return Error::transport("HTTP error: " + message);
}

Result<std::string> normalize_http_url(std::string_view url) {
    auto parsed = ada::parse<ada::url>(url);
    if (parsed.has_value() == false) {
        return tl::unexpected(Error::transport(std::format("Invalid URL '{}'", url)));
    }

    const auto& value = parsed.value();
    const auto protocol = value.get_protocol();
    if (protocol != "http:" && protocol != "https:") {
        return tl::unexpected(Error::transport(
            std::format("Unsupported URL scheme '{}' (expected http or https)", protocol)));
    }
    if (value.get_hostname().empty()) {
        return tl::unexpected(Error::transport(std::format("URL '{}' has no host", url)));
    }
    return std::string(value.get_href());
}

Result<std::string> resolve_url(std::string_view base, std::string_view reference) {
    auto base_url = ada::parse<ada::url>(base);
    if (base_url.has_value() == false) {
        return tl::unexpected(Error::transport(std::format("Invalid base URL '{}'", base)));
    }

    auto resolved = ada::parse<ada::url>(reference, &base_url.value());
    if (resolved.has_value() == false) {
        return tl::unexpected(Error::transport(
            std::format("Cannot resolve '{}' against '{}'", reference, base)));
    }
    return normalize_http_url(resolved->get_href());
}

}  // namespace mcpc
