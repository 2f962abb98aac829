#pragma once

#include "mcpc/error.hpp"

#include <tl/expected.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────

using HeaderMap = std::unordered_map<std::string, std::string>;

/// Case-insensitive lookup (RFC 7230 header names).
inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = std::ranges::find_if(headers, [&name](const auto& pair) {
        return std::ranges::equal(pair.first, name, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    });
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }

    /// All HTTP client failures surface as Transport errors.
    [[nodiscard]] Error to_error() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_sse() const {
        const auto content_type = get_header(headers, "Content-Type");
        if (content_type.has_value() == false) {
            return false;
        }
        return content_type->find("text/event-stream") != std::string::npos;
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

/// Callbacks for a long-lived streaming GET.
struct HttpStreamHandlers {
    /// Called once, before the first body byte, with the status and headers.
    /// Returning false aborts the stream.
    std::function<bool(int status, const HeaderMap& headers)> on_open;

    /// Called for every body chunk. Returning false aborts the stream.
    std::function<bool(std::string_view chunk)> on_data;

    /// Polled while the stream is idle. Returning false aborts the stream.
    std::function<bool()> keep_open;
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Seam between the network transports and the HTTP library, so transports can
// be tested against a scripted client. URLs are absolute.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void set_default_headers(const HeaderMap& headers) = 0;
    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;
    virtual void set_verify_ssl(bool verify) = 0;

    /// `timeout` bounds the whole request; nullopt means no limit.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> get(
        const std::string& url,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> del(
        const std::string& url,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) = 0;

    /// Streaming GET with no read timeout. Blocks until the server closes the
    /// stream or a handler aborts it; returns the final status code.
    [[nodiscard]] virtual HttpClientResult<int> stream_get(
        const std::string& url,
        const HeaderMap& headers,
        HttpStreamHandlers handlers
    ) = 0;
};

/// cpr-backed client.
[[nodiscard]] std::unique_ptr<IHttpClient> make_http_client();

// ─────────────────────────────────────────────────────────────────────────────
// URLs (ada)
// ─────────────────────────────────────────────────────────────────────────────

/// Parses and normalizes an http(s) URL; other schemes are rejected.
[[nodiscard]] Result<std::string> normalize_http_url(std::string_view url);

/// Resolves `reference` (absolute, or relative like "/messages?session=1")
/// against `base`.
[[nodiscard]] Result<std::string> resolve_url(std::string_view base, std::string_view reference);

}  // namespace mcpc
