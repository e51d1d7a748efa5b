#pragma once

#include "vaultpp/credential/token_credential.hpp"
#include "vaultpp/pipeline/pipeline.hpp"
#include "vaultpp/secrets/response.hpp"
#include "vaultpp/secrets/secret_client_options.hpp"
#include "vaultpp/secrets/secret_error.hpp"

#include <ada.h>

#include <future>
#include <memory>
#include <string>
#include <string_view>

namespace vaultpp {

class SecretClientBuilder;
class SetSecretBuilder;

// ═══════════════════════════════════════════════════════════════════════════
// SecretClient
// ═══════════════════════════════════════════════════════════════════════════
// Typed client for the secrets collection of a vault.
//
// Construction, either in one call:
//
//   auto client = SecretClient::create(url, credential, options);
//
// or through a builder:
//
//   auto builder = SecretClient::builder(url, credential);
//   auto client = builder->with_retry(RetryOptions::none()).build();
//
// Operations, either as one call taking an options object:
//
//   auto response = client.set_secret("name", "value", {.content_type = "text/plain"});
//
// or staged through a per-call builder that only runs on send():
//
//   auto response = client.set_secret("name", "value")
//                       .with_content_type("text/plain")
//                       .send();
//
// Both operation shapes go through the same composition step and produce
// identical requests for identical inputs.
//
// Thread safety: a SecretClient is immutable after construction. Copies are
// cheap and share the pipeline; any number of threads may call it at once.

class SecretClient {
public:
    [[nodiscard]] static ConfigResult<SecretClient> create(
        std::string_view endpoint,
        std::shared_ptr<const TokenCredential> credential,
        const SecretClientOptions& options = {}
    );

    [[nodiscard]] static ConfigResult<SecretClientBuilder> builder(
        std::string_view endpoint,
        std::shared_ptr<const TokenCredential> credential
    );

    /// Normalized endpoint including the api-version query parameter.
    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

    [[nodiscard]] const std::string& api_version() const noexcept { return api_version_; }

    [[nodiscard]] HttpMethod set_secret_method() const noexcept { return set_secret_method_; }

    // ─────────────────────────────────────────────────────────────────────────
    // set_secret
    // ─────────────────────────────────────────────────────────────────────────

    /// Stage a call; nothing is sent until SetSecretBuilder::send().
    [[nodiscard]] SetSecretBuilder set_secret(std::string name, std::string value) const;

    /// Send immediately with the given options.
    [[nodiscard]] SecretResult<Response> set_secret(
        std::string_view name,
        std::string_view value,
        const SetSecretOptions& options
    ) const;

    /// Send on a background thread. The client is copied into the task.
    [[nodiscard]] std::future<SecretResult<Response>> async_set_secret(
        std::string name,
        std::string value,
        SetSecretOptions options = {}
    ) const;

private:
    friend class SecretClientBuilder;

    struct PreparedRequest {
        HttpRequest request;
        Context context;
    };

    SecretClient(
        std::string endpoint,
        std::string api_version,
        HttpMethod set_secret_method,
        std::shared_ptr<const Pipeline> pipeline
    );

    [[nodiscard]] SecretResult<PreparedRequest> compose_set_secret(
        std::string_view name,
        std::string_view value,
        const SetSecretOptions& options
    ) const;

    [[nodiscard]] SecretResult<Response> dispatch(PreparedRequest prepared) const;

    std::string endpoint_;
    std::string api_version_;
    HttpMethod set_secret_method_;
    std::shared_ptr<const Pipeline> pipeline_;
};

// ═══════════════════════════════════════════════════════════════════════════
// SecretClientBuilder
// ═══════════════════════════════════════════════════════════════════════════
// Obtained from SecretClient::builder(), which has already validated the
// endpoint and credential, so build() cannot fail.

class SecretClientBuilder {
public:
    SecretClientBuilder& with_options(SecretClientOptions options);
    SecretClientBuilder& with_api_version(std::string version);
    SecretClientBuilder& with_scope(std::string scope);
    SecretClientBuilder& with_set_secret_method(HttpMethod method);
    SecretClientBuilder& with_retry(RetryOptions retry);
    SecretClientBuilder& with_transport(std::shared_ptr<IHttpClient> transport);
    SecretClientBuilder& with_connect_timeout(std::chrono::milliseconds timeout);
    SecretClientBuilder& with_read_timeout(std::chrono::milliseconds timeout);
    SecretClientBuilder& with_per_call_policy(PolicyPtr policy);
    SecretClientBuilder& with_per_retry_policy(PolicyPtr policy);
    SecretClientBuilder& with_application_id(std::string id);

    [[nodiscard]] const SecretClientOptions& options() const noexcept { return options_; }

    [[nodiscard]] SecretClient build() const;

private:
    friend class SecretClient;

    SecretClientBuilder(ada::url endpoint, std::shared_ptr<const TokenCredential> credential);

    ada::url endpoint_;
    std::shared_ptr<const TokenCredential> credential_;
    SecretClientOptions options_;
};

}  // namespace vaultpp
