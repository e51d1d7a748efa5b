#include "vaultpp/transport/http_client.hpp"
#include "vaultpp/log/logger.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <atomic>
#include <cstdint>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// One cpr::Session per request, so concurrent sends never share curl state.
// Settings are atomics: they are written once while the pipeline is built and
// read on every send.

class CprHttpClient final : public IHttpClient {
public:
    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ms_.store(timeout.count());
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ms_.store(timeout.count());
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_.store(verify);
    }

    HttpClientResult<HttpClientResponse> send(const HttpRequest& request) override {
        if (contains_control_characters(request.url)) {
            return tl::unexpected(HttpClientError::invalid_request(
                "URL contains control characters"));
        }

        cpr::Session session;
        session.SetUrl(cpr::Url{request.url});
        session.SetHeader(to_cpr_header(request.headers));
        session.SetConnectTimeout(cpr::ConnectTimeout{
            std::chrono::milliseconds{connect_timeout_ms_.load()}});
        session.SetTimeout(cpr::Timeout{std::chrono::milliseconds{read_timeout_ms_.load()}});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl_.load()});

        const bool has_body = request.body.has_value();
        if (has_body) {
            session.SetBody(cpr::Body{*request.body});
        }

        cpr::Response response;
        switch (request.method) {
            case HttpMethod::Get:    response = session.Get(); break;
            case HttpMethod::Put:    response = session.Put(); break;
            case HttpMethod::Post:   response = session.Post(); break;
            case HttpMethod::Patch:  response = session.Patch(); break;
            case HttpMethod::Delete: response = session.Delete(); break;
        }
        return convert_response(response);
    }

private:
    static bool contains_control_characters(const std::string& url) {
        return std::ranges::any_of(url, [](unsigned char c) {
            return c < 0x20 || c == 0x7F;
        });
    }

    static cpr::Header to_cpr_header(const HeaderMap& headers) {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            VAULTPP_LOG_DEBUG("cpr error {}: {}",
                static_cast<int>(response.error.code), response.error.message);
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

    std::atomic<std::int64_t> connect_timeout_ms_{10'000};
    std::atomic<std::int64_t> read_timeout_ms_{30'000};
    std::atomic<bool> verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace vaultpp
