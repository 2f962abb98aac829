#include "mcpc/transport/http_client.hpp"

#include "mcpc/log/logger.hpp"

#include <cpr/cpr.h>

#include <cstdint>
#include <mutex>

namespace mcpc {

namespace {

// Parses "HTTP/1.1 200 OK" style status lines delivered to the header callback.
std::optional<int> parse_status_line(std::string_view line) {
    if (line.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }
    const auto space = line.find(' ');
    if (space == std::string_view::npos || space + 4 > line.size()) {
        return std::nullopt;
    }
    int status = 0;
    for (std::size_t i = space + 1; i < space + 4; ++i) {
        const char c = line[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        status = status * 10 + (c - '0');
    }
    return status;
}

std::string trim(std::string_view text) {
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

class CprHttpClient final : public IHttpClient {
public:
    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard lock(mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard lock(mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> get(
        const std::string& url,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) override {
        const auto settings = snapshot();
        auto response = cpr::Get(
            cpr::Url{url},
            build_headers(settings.headers, headers),
            cpr::ConnectTimeout{settings.connect_timeout},
            cpr::Timeout{to_cpr_timeout(timeout)},
            cpr::VerifySsl{settings.verify_ssl}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) override {
        const auto settings = snapshot();
        auto merged = build_headers(settings.headers, headers);
        merged["Content-Type"] = content_type;
        auto response = cpr::Post(
            cpr::Url{url},
            merged,
            cpr::Body{body},
            cpr::ConnectTimeout{settings.connect_timeout},
            cpr::Timeout{to_cpr_timeout(timeout)},
            cpr::VerifySsl{settings.verify_ssl}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> del(
        const std::string& url,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) override {
        const auto settings = snapshot();
        auto response = cpr::Delete(
            cpr::Url{url},
            build_headers(settings.headers, headers),
            cpr::ConnectTimeout{settings.connect_timeout},
            cpr::Timeout{to_cpr_timeout(timeout)},
            cpr::VerifySsl{settings.verify_ssl}
        );
        return convert_response(response);
    }

    HttpClientResult<int> stream_get(
        const std::string& url,
        const HeaderMap& headers,
        HttpStreamHandlers handlers
    ) override {
        const auto settings = snapshot();

        int status = 0;
        HeaderMap response_headers;
        bool opened = false;
        bool aborted = false;

        auto header_cb = cpr::HeaderCallback{[&](std::string_view line, intptr_t) {
            if (auto parsed = parse_status_line(line)) {
                // A new status line restarts the header block (redirects, 100-continue).
                status = *parsed;
                response_headers.clear();
                return true;
            }
            const auto colon = line.find(':');
            if (colon != std::string_view::npos) {
                response_headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
            }
            return true;
        }};

        auto write_cb = cpr::WriteCallback{[&](std::string_view data, intptr_t) {
            if (opened == false) {
                opened = true;
                if (handlers.on_open && handlers.on_open(status, response_headers) == false) {
                    aborted = true;
                    return false;
                }
            }
            if (handlers.on_data && handlers.on_data(data) == false) {
                aborted = true;
                return false;
            }
            return true;
        }};

        // libcurl invokes the progress callback about once a second even when
        // no bytes arrive, which is what lets close() end an idle stream.
        auto progress_cb = cpr::ProgressCallback{
            [&](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t) {
                if (handlers.keep_open && handlers.keep_open() == false) {
                    aborted = true;
                    return false;
                }
                return true;
            }};

        auto merged = build_headers(settings.headers, headers);
        merged["Accept"] = "text/event-stream";
        merged["Cache-Control"] = "no-cache";

        cpr::Session session;
        session.SetUrl(cpr::Url{url});
        session.SetHeader(merged);
        session.SetConnectTimeout(cpr::ConnectTimeout{settings.connect_timeout});
        session.SetTimeout(cpr::Timeout{std::chrono::milliseconds{0}});
        session.SetVerifySsl(cpr::VerifySsl{settings.verify_ssl});
        session.SetHeaderCallback(header_cb);
        session.SetWriteCallback(write_cb);
        session.SetProgressCallback(progress_cb);

        const auto response = session.Get();

        if (aborted) {
            return status;
        }
        if (opened == false && response.error.code == cpr::ErrorCode::OK && handlers.on_open) {
            // Empty body: still report the status.
            handlers.on_open(static_cast<int>(response.status_code), response_headers);
        }
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }
        return static_cast<int>(response.status_code);
    }

private:
    struct Settings {
        HeaderMap headers;
        std::chrono::milliseconds connect_timeout;
        bool verify_ssl;
    };

    Settings snapshot() const {
        std::lock_guard lock(mutex_);
        return Settings{default_headers_, connect_timeout_, verify_ssl_};
    }

    // cpr/libcurl treat 0 as "no timeout".
    static std::chrono::milliseconds to_cpr_timeout(std::optional<std::chrono::milliseconds> timeout) {
        return timeout.value_or(std::chrono::milliseconds{0});
    }

    static cpr::Header build_headers(const HeaderMap& defaults, const HeaderMap& extra) {
        cpr::Header out;
        for (const auto& [name, value] : defaults) {
            out[name] = value;
        }
        for (const auto& [name, value] : extra) {
            out[name] = value;
        }
        return out;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);
        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);
            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);
            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    mutable std::mutex mutex_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    bool verify_ssl_{true};
};

}  // namespace

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace mcpc
