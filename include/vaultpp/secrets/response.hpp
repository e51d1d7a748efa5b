#pragma once

#include "vaultpp/secrets/models.hpp"
#include "vaultpp/secrets/secret_error.hpp"
#include "vaultpp/transport/http_client.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────────────────────────────────────
// The raw service response, untouched by the client. Decoding is explicit:
//
//   auto secret = response->json<Secret>();

class Response {
public:
    Response() = default;

    explicit Response(HttpClientResponse raw)
        : raw_(std::move(raw)) {}

    [[nodiscard]] int status() const noexcept { return raw_.status_code; }

    [[nodiscard]] const HeaderMap& headers() const noexcept { return raw_.headers; }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(raw_.headers, name);
    }

    [[nodiscard]] const std::string& body() const noexcept { return raw_.body; }

    [[nodiscard]] const HttpClientResponse& raw() const noexcept { return raw_; }

    template <typename T>
    [[nodiscard]] SecretResult<T> json() const {
        try {
            return Json::parse(raw_.body).template get<T>();
        } catch (const Json::exception& e) {
            return tl::unexpected(SecretError::deserialization(e.what()));
        }
    }

private:
    HttpClientResponse raw_;
};

}  // namespace vaultpp
