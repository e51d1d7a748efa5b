#include "vaultpp/pipeline/pipeline.hpp"
#include "vaultpp/log/logger.hpp"

namespace vaultpp {

namespace {

void append_policies(std::vector<PolicyPtr>& chain, const std::vector<PolicyPtr>& policies) {
    for (const auto& policy : policies) {
        if (policy != nullptr) {
            chain.push_back(policy);
        }
    }
}

std::shared_ptr<IHttpClient> resolve_transport(const ClientOptions& options) {
    if (options.transport != nullptr) {
        return options.transport;
    }
    std::shared_ptr<IHttpClient> client = make_http_client();
    client->set_connect_timeout(options.connect_timeout);
    client->set_read_timeout(options.read_timeout);
    client->set_verify_ssl(options.verify_ssl);
    return client;
}

}  // namespace

Pipeline::Pipeline(
    std::string_view package_name,
    std::string_view package_version,
    const ClientOptions& options,
    std::vector<PolicyPtr> per_call_policies,
    std::vector<PolicyPtr> per_retry_policies
) {
    append_policies(policies_, options.per_call_policies);
    append_policies(policies_, per_call_policies);
    policies_.push_back(std::make_shared<TelemetryPolicy>(
        std::string(package_name), std::string(package_version), options.application_id));
    policies_.push_back(std::make_shared<RetryStage>(
        options.retry.policy(), options.retry.backoff(), options.retry.max_retry_after()));
    append_policies(policies_, options.per_retry_policies);
    append_policies(policies_, per_retry_policies);
    policies_.push_back(std::make_shared<TransportPolicy>(resolve_transport(options)));
}

PipelineResult Pipeline::send(Context& ctx, HttpRequest& request) const {
    VAULTPP_LOG_DEBUG("{} {}", to_string(request.method), request.url);
    auto result = NextPolicy(policies_).send(ctx, request);
    if (result) {
        VAULTPP_LOG_DEBUG("{} {} -> {}", to_string(request.method), request.url, result->status_code);
    } else {
        VAULTPP_LOG_WARN("{} {} failed ({}): {}", to_string(request.method), request.url,
            to_string(result.error().code), result.error().message);
    }
    return result;
}

}  // namespace vaultpp
