#ifndef VAULTPP_PIPELINE_CLIENT_OPTIONS_HPP
#define VAULTPP_PIPELINE_CLIENT_OPTIONS_HPP

#include "vaultpp/pipeline/policy.hpp"
#include "vaultpp/transport/backoff_policy.hpp"
#include "vaultpp/transport/http_client.hpp"
#include "vaultpp/transport/retry_policy.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// Retry Options
// ─────────────────────────────────────────────────────────────────────────────

struct ExponentialRetryOptions {
    std::size_t max_retries{3};
    std::chrono::milliseconds initial_delay{800};
    std::chrono::milliseconds max_delay{60'000};
    double multiplier{2.0};
    double jitter_factor{0.2};
};

struct FixedRetryOptions {
    std::size_t max_retries{3};
    std::chrono::milliseconds delay{800};
};

// Which failures are retried (RetryPolicy) and how long to wait between
// attempts (IBackoffPolicy), packaged for client construction:
//
//   auto builder = SecretClient::builder(url, credential);
//   if (builder) {
//       builder->with_retry(RetryOptions::exponential({.max_retries = 5}));
//       auto client = builder->build();
//   }

class RetryOptions {
public:
    RetryOptions();

    [[nodiscard]] static RetryOptions exponential(const ExponentialRetryOptions& options = {});
    [[nodiscard]] static RetryOptions fixed(const FixedRetryOptions& options = {});
    [[nodiscard]] static RetryOptions none();

    /// Replace the retry predicate, keeping the backoff.
    RetryOptions& with_policy(RetryPolicy policy);

    /// Replace the backoff, keeping the retry predicate.
    RetryOptions& with_backoff(std::shared_ptr<IBackoffPolicy> backoff);

    /// Upper bound on a server-requested Retry-After wait.
    RetryOptions& with_max_retry_after(std::chrono::milliseconds limit);

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] const std::shared_ptr<IBackoffPolicy>& backoff() const noexcept { return backoff_; }
    [[nodiscard]] std::chrono::milliseconds max_retry_after() const noexcept { return max_retry_after_; }

private:
    RetryOptions(RetryPolicy policy, std::shared_ptr<IBackoffPolicy> backoff);

    RetryPolicy policy_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    std::chrono::milliseconds max_retry_after_{60'000};
};

// ─────────────────────────────────────────────────────────────────────────────
// ClientOptions
// ─────────────────────────────────────────────────────────────────────────────
// Pipeline settings shared by every service client.

struct ClientOptions {
    RetryOptions retry;

    // If null, a cpr client is created and the timeouts below are applied
    // to it. A caller-supplied transport is used as-is.
    std::shared_ptr<IHttpClient> transport;

    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds read_timeout{30'000};
    bool verify_ssl{true};

    // Run once per logical call, before the retry stage.
    std::vector<PolicyPtr> per_call_policies;

    // Run on every attempt, after the retry stage.
    std::vector<PolicyPtr> per_retry_policies;

    // Prefixed to the User-Agent header.
    std::string application_id;

    ClientOptions& with_retry(RetryOptions options);
    ClientOptions& with_transport(std::shared_ptr<IHttpClient> client);
    ClientOptions& with_connect_timeout(std::chrono::milliseconds timeout);
    ClientOptions& with_read_timeout(std::chrono::milliseconds timeout);
    ClientOptions& with_per_call_policy(PolicyPtr policy);
    ClientOptions& with_per_retry_policy(PolicyPtr policy);
    ClientOptions& with_application_id(std::string id);
};

}  // namespace vaultpp

#endif  // VAULTPP_PIPELINE_CLIENT_OPTIONS_HPP
