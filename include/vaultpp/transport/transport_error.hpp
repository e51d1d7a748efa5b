#ifndef VAULTPP_TRANSPORT_TRANSPORT_ERROR_HPP
#define VAULTPP_TRANSPORT_TRANSPORT_ERROR_HPP

#include "vaultpp/transport/http_client.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// HttpTransportError
// ─────────────────────────────────────────────────────────────────────────────
// Everything the pipeline can fail with. Callers of SecretClient see this
// value unchanged inside SecretError::transport.

struct HttpTransportError {
    enum class Code {
        ConnectionFailed,    // could not reach the service
        Timeout,
        SslError,
        HttpError,           // service answered with a non-2xx status
        Cancelled,           // context cancelled or deadline passed
        Authentication,      // credential could not produce a token
        InvalidRequest       // request rejected before it left the process
    };

    Code code;
    std::string message;
    std::optional<int> http_status;
    std::optional<HttpClientResponse> response;  // the failed response, HttpError only

    static HttpTransportError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg, std::nullopt, std::nullopt};
    }

    static HttpTransportError timeout(const std::string& msg) {
        return {Code::Timeout, msg, std::nullopt, std::nullopt};
    }

    static HttpTransportError ssl_error(const std::string& msg) {
        return {Code::SslError, msg, std::nullopt, std::nullopt};
    }

    static HttpTransportError http_error(HttpClientResponse failed) {
        const int status = failed.status_code;
        std::string msg = "HTTP " + std::to_string(status);
        if (failed.body.empty() == false) {
            msg += ": " + failed.body;
        }
        return {Code::HttpError, std::move(msg), status, std::move(failed)};
    }

    static HttpTransportError cancelled(const std::string& msg = "Request cancelled") {
        return {Code::Cancelled, msg, std::nullopt, std::nullopt};
    }

    static HttpTransportError authentication(const std::string& msg) {
        return {Code::Authentication, msg, std::nullopt, std::nullopt};
    }

    static HttpTransportError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg, std::nullopt, std::nullopt};
    }

    static HttpTransportError from_client_error(const HttpClientError& err) {
        switch (err.code) {
            case HttpClientError::Code::ConnectionFailed:
                return connection_failed(err.message);
            case HttpClientError::Code::Timeout:
                return timeout(err.message);
            case HttpClientError::Code::SslError:
                return ssl_error(err.message);
            case HttpClientError::Code::InvalidRequest:
                return invalid_request(err.message);
            default:
                return connection_failed(err.message);
        }
    }
};

[[nodiscard]] constexpr std::string_view to_string(HttpTransportError::Code code) noexcept {
    switch (code) {
        case HttpTransportError::Code::ConnectionFailed: return "ConnectionFailed";
        case HttpTransportError::Code::Timeout:          return "Timeout";
        case HttpTransportError::Code::SslError:         return "SslError";
        case HttpTransportError::Code::HttpError:        return "HttpError";
        case HttpTransportError::Code::Cancelled:        return "Cancelled";
        case HttpTransportError::Code::Authentication:   return "Authentication";
        case HttpTransportError::Code::InvalidRequest:   return "InvalidRequest";
    }
    return "Unknown";
}

template <typename T>
using HttpResult = tl::expected<T, HttpTransportError>;

}  // namespace vaultpp

#endif  // VAULTPP_TRANSPORT_TRANSPORT_ERROR_HPP
