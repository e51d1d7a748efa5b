#pragma once

#include "vaultpp/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        InvalidRequest,
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
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

[[nodiscard]] constexpr std::string_view to_string(HttpClientError::Code code) noexcept {
    switch (code) {
        case HttpClientError::Code::ConnectionFailed: return "ConnectionFailed";
        case HttpClientError::Code::Timeout:          return "Timeout";
        case HttpClientError::Code::SslError:         return "SslError";
        case HttpClientError::Code::InvalidRequest:   return "InvalidRequest";
        case HttpClientError::Code::Unknown:          return "Unknown";
    }
    return "Unknown";
}

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
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// The last stage of the pipeline: performs exactly one network exchange for a
// fully-formed request. No retries, no auth, no status interpretation; those
// belong to the policies in front of it.
//
// Implementations must be safe to call from several threads at once, since a
// single client instance is shared by every copy of a SecretClient.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> send(const HttpRequest& request) = 0;

};

// Default implementation (cpr / libcurl).
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace vaultpp
