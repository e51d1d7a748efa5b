#include "vaultpp/pipeline/client_options.hpp"

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// RetryOptions
// ─────────────────────────────────────────────────────────────────────────────

RetryOptions::RetryOptions()
    : RetryOptions(exponential())
{}

RetryOptions::RetryOptions(RetryPolicy policy, std::shared_ptr<IBackoffPolicy> backoff)
    : policy_(std::move(policy))
    , backoff_(std::move(backoff))
{}

RetryOptions RetryOptions::exponential(const ExponentialRetryOptions& options) {
    RetryPolicy policy;
    policy.with_max_attempts(options.max_retries);
    return RetryOptions(
        std::move(policy),
        std::make_shared<ExponentialBackoff>(
            options.initial_delay,
            options.multiplier,
            options.max_delay,
            options.jitter_factor
        )
    );
}

RetryOptions RetryOptions::fixed(const FixedRetryOptions& options) {
    RetryPolicy policy;
    policy.with_max_attempts(options.max_retries);
    return RetryOptions(std::move(policy), std::make_shared<FixedBackoff>(options.delay));
}

RetryOptions RetryOptions::none() {
    RetryPolicy policy;
    policy.with_max_attempts(0);
    return RetryOptions(std::move(policy), std::make_shared<NoBackoff>());
}

RetryOptions& RetryOptions::with_policy(RetryPolicy policy) {
    policy_ = std::move(policy);
    return *this;
}

RetryOptions& RetryOptions::with_backoff(std::shared_ptr<IBackoffPolicy> backoff) {
    if (backoff != nullptr) {
        backoff_ = std::move(backoff);
    }
    return *this;
}

RetryOptions& RetryOptions::with_max_retry_after(std::chrono::milliseconds limit) {
    max_retry_after_ = limit;
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// ClientOptions
// ─────────────────────────────────────────────────────────────────────────────

ClientOptions& ClientOptions::with_retry(RetryOptions options) {
    retry = std::move(options);
    return *this;
}

ClientOptions& ClientOptions::with_transport(std::shared_ptr<IHttpClient> client) {
    transport = std::move(client);
    return *this;
}

ClientOptions& ClientOptions::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

ClientOptions& ClientOptions::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

ClientOptions& ClientOptions::with_per_call_policy(PolicyPtr policy) {
    per_call_policies.push_back(std::move(policy));
    return *this;
}

ClientOptions& ClientOptions::with_per_retry_policy(PolicyPtr policy) {
    per_retry_policies.push_back(std::move(policy));
    return *this;
}

ClientOptions& ClientOptions::with_application_id(std::string id) {
    application_id = std::move(id);
    return *this;
}

}  // namespace vaultpp
