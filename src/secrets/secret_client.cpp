#include "vaultpp/secrets/secret_client.hpp"
#include "vaultpp/secrets/set_secret_builder.hpp"
#include "vaultpp/log/logger.hpp"
#include "vaultpp/version.hpp"

#include <vector>

namespace vaultpp {

namespace {

constexpr std::string_view kSetSecretSpan = "SecretClient::set_secret";
constexpr std::string_view kSecretsCollection = "/secrets/";

bool is_http_endpoint(const ada::url& url) {
    const auto scheme = url.get_protocol();
    const bool http_scheme = (scheme == "http:") || (scheme == "https:");
    return http_scheme && (url.get_hostname().empty() == false);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<SecretClient> SecretClient::create(
    std::string_view endpoint,
    std::shared_ptr<const TokenCredential> credential,
    const SecretClientOptions& options
) {
    auto builder = SecretClient::builder(endpoint, std::move(credential));
    if (builder.has_value() == false) {
        return tl::unexpected(builder.error());
    }
    builder->with_options(options);
    return builder->build();
}

ConfigResult<SecretClientBuilder> SecretClient::builder(
    std::string_view endpoint,
    std::shared_ptr<const TokenCredential> credential
) {
    const std::string raw(endpoint);
    auto parsed = ada::parse<ada::url>(raw);
    const bool valid = parsed.has_value() && is_http_endpoint(*parsed);
    if (valid == false) {
        VAULTPP_LOG_ERROR("Rejecting endpoint: not an absolute http(s) URL with a host");
        return tl::unexpected(ConfigError::invalid_endpoint(endpoint));
    }

    if (credential == nullptr) {
        return tl::unexpected(ConfigError::invalid_credential());
    }

    return SecretClientBuilder(std::move(*parsed), std::move(credential));
}

SecretClient::SecretClient(
    std::string endpoint,
    std::string api_version,
    HttpMethod set_secret_method,
    std::shared_ptr<const Pipeline> pipeline
)
    : endpoint_(std::move(endpoint))
    , api_version_(std::move(api_version))
    , set_secret_method_(set_secret_method)
    , pipeline_(std::move(pipeline))
{}

// ═══════════════════════════════════════════════════════════════════════════
// set_secret
// ═══════════════════════════════════════════════════════════════════════════

SetSecretBuilder SecretClient::set_secret(std::string name, std::string value) const {
    return SetSecretBuilder(*this, std::move(name), std::move(value));
}

SecretResult<Response> SecretClient::set_secret(
    std::string_view name,
    std::string_view value,
    const SetSecretOptions& options
) const {
    auto prepared = compose_set_secret(name, value, options);
    if (prepared.has_value() == false) {
        return tl::unexpected(prepared.error());
    }
    return dispatch(std::move(*prepared));
}

std::future<SecretResult<Response>> SecretClient::async_set_secret(
    std::string name,
    std::string value,
    SetSecretOptions options
) const {
    return std::async(std::launch::async,
        [client = *this, name = std::move(name), value = std::move(value),
         options = std::move(options)]() {
            return client.set_secret(name, value, options);
        });
}

SecretResult<SecretClient::PreparedRequest> SecretClient::compose_set_secret(
    std::string_view name,
    std::string_view value,
    const SetSecretOptions& options
) const {
    auto url = ada::parse<ada::url>(endpoint_);
    if (url.has_value() == false) {
        return tl::unexpected(SecretError::invalid_endpoint(endpoint_));
    }

    // Assembled by hand: ada's path setter would resolve "." and ".." names.
    // The endpoint's own path is replaced; its api-version query is kept.
    std::string request_url = url->get_origin();
    request_url += kSecretsCollection;
    request_url += encode_path_segment(name);
    request_url += url->get_search();

    Context context = options.context.value_or(Context{});
    context.push_span(std::string(kSetSecretSpan));

    SetSecretRequest payload;
    payload.value = std::string(value);
    if (options.properties.has_value()) {
        payload.properties = options.properties;
    }
    if (options.content_type.has_value()) {
        payload.content_type = options.content_type;
    }
    if (options.tags.has_value()) {
        payload.tags = options.tags;
    }

    std::string body;
    try {
        body = Json(payload).dump();
    } catch (const Json::exception& e) {
        return tl::unexpected(SecretError::serialization(e.what()));
    }

    HttpRequest request;
    request.method = set_secret_method_;
    request.url = std::move(request_url);
    request.with_header("Content-Type", "application/json")
           .with_header("Accept", "application/json")
           .with_body(std::move(body));

    return PreparedRequest{std::move(request), std::move(context)};
}

SecretResult<Response> SecretClient::dispatch(PreparedRequest prepared) const {
    auto result = pipeline_->send(prepared.context, prepared.request);
    if (result.has_value() == false) {
        return tl::unexpected(SecretError::from_transport(std::move(result.error())));
    }
    return Response(std::move(*result));
}

// ═══════════════════════════════════════════════════════════════════════════
// SecretClientBuilder
// ═══════════════════════════════════════════════════════════════════════════

SecretClientBuilder::SecretClientBuilder(
    ada::url endpoint,
    std::shared_ptr<const TokenCredential> credential
)
    : endpoint_(std::move(endpoint))
    , credential_(std::move(credential))
{}

SecretClientBuilder& SecretClientBuilder::with_options(SecretClientOptions options) {
    options_ = std::move(options);
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_api_version(std::string version) {
    options_.api_version = std::move(version);
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_scope(std::string scope) {
    options_.scope = std::move(scope);
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_set_secret_method(HttpMethod method) {
    options_.set_secret_method = method;
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_retry(RetryOptions retry) {
    options_.client.with_retry(std::move(retry));
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_transport(std::shared_ptr<IHttpClient> transport) {
    options_.client.with_transport(std::move(transport));
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_connect_timeout(std::chrono::milliseconds timeout) {
    options_.client.with_connect_timeout(timeout);
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_read_timeout(std::chrono::milliseconds timeout) {
    options_.client.with_read_timeout(timeout);
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_per_call_policy(PolicyPtr policy) {
    options_.client.with_per_call_policy(std::move(policy));
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_per_retry_policy(PolicyPtr policy) {
    options_.client.with_per_retry_policy(std::move(policy));
    return *this;
}

SecretClientBuilder& SecretClientBuilder::with_application_id(std::string id) {
    options_.client.with_application_id(std::move(id));
    return *this;
}

SecretClient SecretClientBuilder::build() const {
    ada::url endpoint = endpoint_;
    endpoint.set_hash("");
    endpoint.set_search("api-version=" + options_.api_version);

    std::vector<PolicyPtr> per_retry{
        std::make_shared<BearerTokenPolicy>(credential_, std::vector<std::string>{options_.scope})
    };
    std::shared_ptr<const Pipeline> pipeline = std::make_shared<Pipeline>(
        kPackageName,
        kPackageVersion,
        options_.client,
        std::vector<PolicyPtr>{},
        std::move(per_retry)
    );

    VAULTPP_LOG_DEBUG("SecretClient for {} (api-version {})", endpoint.get_origin(), options_.api_version);
    return SecretClient(
        endpoint.get_href(),
        options_.api_version,
        options_.set_secret_method,
        std::move(pipeline)
    );
}

}  // namespace vaultpp
