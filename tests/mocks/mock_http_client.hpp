#ifndef MCPC_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define MCPC_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "mcpc/transport/http_client.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpc::testing {

enum class HttpMethod { Get, Post, Delete, StreamGet };

struct RecordedRequest {
    HttpMethod method;
    std::string url;
    std::string body;
    std::string content_type;
    HeaderMap headers;
    std::optional<std::chrono::milliseconds> timeout;
};

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Plain requests are answered from a queue (or a handler). stream_get() opens
// a scripted stream: tests push body chunks with push_stream_chunk() and end
// it with end_stream(); otherwise it stays open until keep_open() says stop.

class MockHttpClient final : public IHttpClient {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup - Queue Responses
    // ─────────────────────────────────────────────────────────────────────────

    void queue_response(int status_code, const std::string& body, const HeaderMap& headers = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        resp.result = HttpClientResponse{status_code, headers, body};
        response_queue_.push_back(std::move(resp));
    }

    void queue_json_response(int status_code, const std::string& body) {
        queue_response(status_code, body, HeaderMap{{"Content-Type", "application/json"}});
    }

    void queue_sse_response(const std::string& body) {
        queue_response(200, body, HeaderMap{{"Content-Type", "text/event-stream"}});
    }

    void queue_response_with_session(int status_code, const std::string& body,
                                     const std::string& session_id) {
        queue_response(status_code, body,
                       HeaderMap{{"Content-Type", "application/json"}, {"Mcp-Session-Id", session_id}});
    }

    void queue_error(HttpClientError::Code code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        resp.error = HttpClientError{code, message};
        response_queue_.push_back(std::move(resp));
    }

    void queue_connection_error(const std::string& message = "Connection refused") {
        queue_error(HttpClientError::Code::ConnectionFailed, message);
    }

    /// Dynamic answers for POSTs; takes precedence over the queue.
    using PostHandler = std::function<HttpClientResult<HttpClientResponse>(
        const std::string& url, const std::string& body)>;

    void set_post_handler(PostHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        post_handler_ = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup - Scripted Stream
    // ─────────────────────────────────────────────────────────────────────────

    void set_stream_status(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_status_ = status;
    }

    void push_stream_chunk(const std::string& chunk) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stream_chunks_.push_back(chunk);
        }
        stream_cv_.notify_all();
    }

    /// Server-side close of the stream.
    void end_stream() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stream_ended_ = true;
        }
        stream_cv_.notify_all();
    }

    [[nodiscard]] bool stream_active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_active_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification - Check Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t count(HttpMethod method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& req : requests_) {
            n += req.method == method ? 1 : 0;
        }
        return n;
    }

    [[nodiscard]] std::optional<RecordedRequest> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::nullopt;
        }
        return requests_.back();
    }

    [[nodiscard]] HeaderMap default_headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return default_headers_;
    }

    [[nodiscard]] std::chrono::milliseconds connect_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_timeout_;
    }

    [[nodiscard]] bool verify_ssl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verify_ssl_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> get(
        const std::string& url,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) override {
        return make_request(HttpMethod::Get, url, "", "", headers, timeout);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) override {
        PostHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = post_handler_;
        }
        if (handler) {
            record(HttpMethod::Post, url, body, content_type, headers, timeout);
            return handler(url, body);
        }
        return make_request(HttpMethod::Post, url, body, content_type, headers, timeout);
    }

    HttpClientResult<HttpClientResponse> del(
        const std::string& url,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) override {
        return make_request(HttpMethod::Delete, url, "", "", headers, timeout);
    }

    HttpClientResult<int> stream_get(
        const std::string& url,
        const HeaderMap& headers,
        HttpStreamHandlers handlers
    ) override {
        record(HttpMethod::StreamGet, url, "", "", headers, std::nullopt);

        int status = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status = stream_status_;
            stream_active_ = true;
        }
        if (handlers.on_open && handlers.on_open(status, HeaderMap{{"Content-Type", "text/event-stream"}}) == false) {
            set_inactive();
            return status;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            stream_cv_.wait_for(lock, std::chrono::milliseconds{10}, [this] {
                return stream_chunks_.empty() == false || stream_ended_;
            });

            while (stream_chunks_.empty() == false) {
                auto chunk = std::move(stream_chunks_.front());
                stream_chunks_.pop_front();
                lock.unlock();
                const bool keep = handlers.on_data == nullptr || handlers.on_data(chunk);
                lock.lock();
                if (keep == false) {
                    stream_active_ = false;
                    return status;
                }
            }

            if (stream_ended_) {
                stream_active_ = false;
                return status;
            }

            lock.unlock();
            const bool keep = handlers.keep_open == nullptr || handlers.keep_open();
            lock.lock();
            if (keep == false) {
                stream_active_ = false;
                return tl::unexpected(HttpClientError::cancelled());
            }
        }
    }

private:
    struct QueuedResponse {
        std::optional<HttpClientResponse> result;
        std::optional<HttpClientError> error;
    };

    void record(HttpMethod method, const std::string& url, const std::string& body,
                const std::string& content_type, const HeaderMap& headers,
                std::optional<std::chrono::milliseconds> timeout) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(RecordedRequest{method, url, body, content_type, headers, timeout});
    }

    void set_inactive() {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_active_ = false;
    }

    HttpClientResult<HttpClientResponse> make_request(
        HttpMethod method,
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers,
        std::optional<std::chrono::milliseconds> timeout
    ) {
        record(method, url, body, content_type, headers, timeout);

        std::lock_guard<std::mutex> lock(mutex_);
        if (response_queue_.empty()) {
            return HttpClientResponse{202, {}, ""};
        }
        auto resp = std::move(response_queue_.front());
        response_queue_.pop_front();
        if (resp.error.has_value()) {
            return tl::unexpected(*resp.error);
        }
        return *resp.result;
    }

    mutable std::mutex mutex_;
    std::condition_variable stream_cv_;

    std::vector<RecordedRequest> requests_;
    std::deque<QueuedResponse> response_queue_;
    PostHandler post_handler_;

    int stream_status_{200};
    std::deque<std::string> stream_chunks_;
    bool stream_ended_{false};
    bool stream_active_{false};

    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{0};
    bool verify_ssl_{true};
};

}  // namespace mcpc::testing

#endif  // MCPC_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
