#ifndef VAULTPP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define VAULTPP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "vaultpp/pipeline/policy.hpp"
#include "vaultpp/transport/http_client.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vaultpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Allows tests to:
// - Queue canned responses and errors
// - Inspect every request exactly as it reached the transport
// - Answer dynamically through a handler

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
        HeaderMap headers;
        headers["Content-Type"] = "application/json";
        queue_response(status_code, body, headers);
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

    void queue_timeout(const std::string& message = "Request timed out") {
        queue_error(HttpClientError::Code::Timeout, message);
    }

    void queue_ssl_error(const std::string& message = "SSL handshake failed") {
        queue_error(HttpClientError::Code::SslError, message);
    }

    using ResponseHandler = std::function<HttpClientResult<HttpClientResponse>(const HttpRequest&)>;

    void set_response_handler(ResponseHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        response_handler_ = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification - Check Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] std::optional<HttpRequest> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::nullopt;
        }
        return requests_.back();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
        response_queue_.clear();
        response_handler_ = nullptr;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::chrono::milliseconds connect_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_timeout_;
    }

    [[nodiscard]] std::chrono::milliseconds read_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return read_timeout_;
    }

    [[nodiscard]] bool verify_ssl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verify_ssl_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> send(const HttpRequest& request) override {
        ResponseHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            handler = response_handler_;
        }

        // Handler runs unlocked so it may inspect the mock
        if (handler) {
            return handler(request);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (response_queue_.empty()) {
            // Default: 200 OK with an empty JSON object
            return HttpClientResponse{200, {{"Content-Type", "application/json"}}, "{}"};
        }

        auto queued = std::move(response_queue_.front());
        response_queue_.pop_front();

        if (queued.error.has_value()) {
            return tl::unexpected(*queued.error);
        }
        return *queued.result;
    }

private:
    struct QueuedResponse {
        std::optional<HttpClientResponse> result;
        std::optional<HttpClientError> error;
    };

    mutable std::mutex mutex_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{true};

    std::vector<HttpRequest> requests_;
    std::deque<QueuedResponse> response_queue_;
    ResponseHandler response_handler_;
};

// ─────────────────────────────────────────────────────────────────────────────
// RecordingPolicy - captures the Context each call travels with
// ─────────────────────────────────────────────────────────────────────────────

class RecordingPolicy final : public IPolicy {
public:
    PipelineResult send(Context& ctx, HttpRequest& request, NextPolicy next) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            contexts_.push_back(ctx);
        }
        return next.send(ctx, request);
    }

    [[nodiscard]] std::vector<Context> contexts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contexts_;
    }

    [[nodiscard]] std::optional<Context> last_context() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (contexts_.empty()) {
            return std::nullopt;
        }
        return contexts_.back();
    }

private:
    mutable std::mutex mutex_;
    mutable std::vector<Context> contexts_;
};

}  // namespace vaultpp::testing

#endif  // VAULTPP_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
