#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Secret client errors
// ═══════════════════════════════════════════════════════════════════════════
// ConfigError is returned while building a client and means no client was
// created. SecretError is returned per operation; transport failures are
// kept intact in SecretError::transport so callers can branch on the
// original category and HTTP status.

#include "vaultpp/transport/transport_error.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// ConfigError
// ─────────────────────────────────────────────────────────────────────────────

struct ConfigError {
    enum class Code {
        InvalidEndpoint,
        InvalidCredential
    };

    Code code;
    std::string message;

    [[nodiscard]] static ConfigError invalid_endpoint(std::string_view endpoint) {
        return {Code::InvalidEndpoint, "Invalid endpoint URL: '" + std::string(endpoint) + "'"};
    }

    [[nodiscard]] static ConfigError invalid_credential() {
        return {Code::InvalidCredential, "Credential must not be null"};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ConfigError::Code code) noexcept {
    switch (code) {
        case ConfigError::Code::InvalidEndpoint:   return "InvalidEndpoint";
        case ConfigError::Code::InvalidCredential: return "InvalidCredential";
    }
    return "Unknown";
}

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ─────────────────────────────────────────────────────────────────────────────
// SecretError
// ─────────────────────────────────────────────────────────────────────────────

enum class SecretErrorCode {
    InvalidEndpoint,   ///< Stored endpoint could not be parsed into a request URL
    Serialization,     ///< Request body could not be encoded
    Transport,         ///< Pipeline failure; see SecretError::transport
    Deserialization    ///< Response body did not decode into the requested model
};

[[nodiscard]] constexpr std::string_view to_string(SecretErrorCode code) noexcept {
    switch (code) {
        case SecretErrorCode::InvalidEndpoint: return "InvalidEndpoint";
        case SecretErrorCode::Serialization:   return "Serialization";
        case SecretErrorCode::Transport:       return "Transport";
        case SecretErrorCode::Deserialization: return "Deserialization";
    }
    return "Unknown";
}

struct SecretError {
    SecretErrorCode code;
    std::string message;
    std::optional<HttpTransportError> transport;

    [[nodiscard]] static SecretError invalid_endpoint(std::string_view endpoint) {
        return {SecretErrorCode::InvalidEndpoint,
                "Cannot build request URL from endpoint '" + std::string(endpoint) + "'",
                std::nullopt};
    }

    [[nodiscard]] static SecretError serialization(std::string msg) {
        return {SecretErrorCode::Serialization, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static SecretError deserialization(std::string msg) {
        return {SecretErrorCode::Deserialization, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static SecretError from_transport(HttpTransportError err) {
        std::string msg = err.message;
        return {SecretErrorCode::Transport, std::move(msg), std::move(err)};
    }

    /// Status of the failed response, if the service answered at all.
    [[nodiscard]] std::optional<int> http_status() const {
        if (transport.has_value()) {
            return transport->http_status;
        }
        return std::nullopt;
    }
};

template <typename T>
using SecretResult = tl::expected<T, SecretError>;

}  // namespace vaultpp
