#include "vaultpp/credential/token_credential.hpp"
#include "vaultpp/log/logger.hpp"

#include <cstdlib>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// StaticTokenCredential
// ─────────────────────────────────────────────────────────────────────────────

StaticTokenCredential::StaticTokenCredential(
    std::string token,
    std::chrono::system_clock::time_point expires_on
)
    : token_{std::move(token), expires_on}
{}

CredentialResult<AccessToken> StaticTokenCredential::get_token(
    const std::vector<std::string>& /*scopes*/,
    const Context& /*ctx*/
) const {
    if (token_.token.empty()) {
        return tl::unexpected(CredentialError{"Static credential holds an empty token"});
    }
    return token_;
}

// ─────────────────────────────────────────────────────────────────────────────
// EnvironmentTokenCredential
// ─────────────────────────────────────────────────────────────────────────────

EnvironmentTokenCredential::EnvironmentTokenCredential(
    std::string variable,
    std::chrono::seconds lifetime
)
    : variable_(std::move(variable))
    , lifetime_(lifetime)
{}

CredentialResult<AccessToken> EnvironmentTokenCredential::get_token(
    const std::vector<std::string>& /*scopes*/,
    const Context& /*ctx*/
) const {
    const char* value = std::getenv(variable_.c_str());
    const bool missing = (value == nullptr) || (*value == '\0');
    if (missing) {
        return tl::unexpected(CredentialError{"Environment variable " + variable_ + " is not set"});
    }
    return AccessToken{value, std::chrono::system_clock::now() + lifetime_};
}

// ─────────────────────────────────────────────────────────────────────────────
// BearerTokenPolicy
// ─────────────────────────────────────────────────────────────────────────────

BearerTokenPolicy::BearerTokenPolicy(
    std::shared_ptr<const TokenCredential> credential,
    std::vector<std::string> scopes
)
    : credential_(std::move(credential))
    , scopes_(std::move(scopes))
{}

CredentialResult<std::string> BearerTokenPolicy::current_token(const Context& ctx) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    const auto now = std::chrono::system_clock::now();
    const bool fresh = cached_.has_value() && (cached_->expires_on - now > kRefreshMargin);
    if (fresh) {
        return cached_->token;
    }

    auto token = credential_->get_token(scopes_, ctx);
    if (token.has_value() == false) {
        return tl::unexpected(token.error());
    }
    VAULTPP_LOG_DEBUG("Acquired access token for {} scope(s)", scopes_.size());
    cached_ = std::move(*token);
    return cached_->token;
}

PipelineResult BearerTokenPolicy::send(Context& ctx, HttpRequest& request, NextPolicy next) const {
    auto token = current_token(ctx);
    if (token.has_value() == false) {
        return tl::unexpected(HttpTransportError::authentication(token.error().message));
    }
    request.headers["Authorization"] = "Bearer " + *token;
    return next.send(ctx, request);
}

}  // namespace vaultpp
