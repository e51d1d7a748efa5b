#pragma once

#include "vaultpp/pipeline/context.hpp"
#include "vaultpp/pipeline/policy.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// Access Tokens
// ─────────────────────────────────────────────────────────────────────────────

struct AccessToken {
    std::string token;
    std::chrono::system_clock::time_point expires_on{std::chrono::system_clock::time_point::max()};
};

struct CredentialError {
    std::string message;
};

template <typename T>
using CredentialResult = tl::expected<T, CredentialError>;

// ─────────────────────────────────────────────────────────────────────────────
// TokenCredential
// ─────────────────────────────────────────────────────────────────────────────
// Source of bearer tokens. How a token is obtained (managed identity, device
// code, a CLI login) is up to the implementation; the client only sees this
// interface, through BearerTokenPolicy.

class TokenCredential {
public:
    virtual ~TokenCredential() = default;

    [[nodiscard]] virtual CredentialResult<AccessToken> get_token(
        const std::vector<std::string>& scopes,
        const Context& ctx
    ) const = 0;
};

// Always returns the token it was constructed with.
class StaticTokenCredential final : public TokenCredential {
public:
    explicit StaticTokenCredential(
        std::string token,
        std::chrono::system_clock::time_point expires_on = std::chrono::system_clock::time_point::max()
    );

    [[nodiscard]] CredentialResult<AccessToken> get_token(
        const std::vector<std::string>& scopes,
        const Context& ctx
    ) const override;

private:
    AccessToken token_;
};

// Reads the token from an environment variable on every request, so a token
// rotated by an external process is picked up once the cached one expires.
class EnvironmentTokenCredential final : public TokenCredential {
public:
    static constexpr const char* kDefaultVariable = "VAULT_ACCESS_TOKEN";

    explicit EnvironmentTokenCredential(
        std::string variable = kDefaultVariable,
        std::chrono::seconds lifetime = std::chrono::hours{1}
    );

    [[nodiscard]] CredentialResult<AccessToken> get_token(
        const std::vector<std::string>& scopes,
        const Context& ctx
    ) const override;

private:
    std::string variable_;
    std::chrono::seconds lifetime_;
};

// ─────────────────────────────────────────────────────────────────────────────
// BearerTokenPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Per-retry policy that sets "Authorization: Bearer <token>". The token is
// cached and refreshed once it is within kRefreshMargin of expiring.

class BearerTokenPolicy final : public IPolicy {
public:
    static constexpr std::chrono::minutes kRefreshMargin{5};

    BearerTokenPolicy(std::shared_ptr<const TokenCredential> credential,
                      std::vector<std::string> scopes);

    [[nodiscard]] PipelineResult send(Context& ctx, HttpRequest& request, NextPolicy next) const override;

private:
    [[nodiscard]] CredentialResult<std::string> current_token(const Context& ctx) const;

    std::shared_ptr<const TokenCredential> credential_;
    std::vector<std::string> scopes_;

    mutable std::mutex cache_mutex_;
    mutable std::optional<AccessToken> cached_;
};

}  // namespace vaultpp
