#pragma once

#include "vaultpp/pipeline/context.hpp"
#include "vaultpp/transport/backoff_policy.hpp"
#include "vaultpp/transport/http_client.hpp"
#include "vaultpp/transport/http_types.hpp"
#include "vaultpp/transport/retry_policy.hpp"
#include "vaultpp/transport/transport_error.hpp"

#include <chrono>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace vaultpp {

using PipelineResult = HttpResult<HttpClientResponse>;

class IPolicy;
using PolicyPtr = std::shared_ptr<const IPolicy>;

// ─────────────────────────────────────────────────────────────────────────────
// NextPolicy
// ─────────────────────────────────────────────────────────────────────────────
// A view of the policies after the current one. Calling send() hands the
// request to the next stage; the transport stage is always last.

class NextPolicy {
public:
    explicit NextPolicy(std::span<const PolicyPtr> remaining) noexcept
        : remaining_(remaining) {}

    [[nodiscard]] PipelineResult send(Context& ctx, HttpRequest& request) const;

private:
    std::span<const PolicyPtr> remaining_;
};

// ─────────────────────────────────────────────────────────────────────────────
// IPolicy
// ─────────────────────────────────────────────────────────────────────────────
// One pipeline stage. A policy may edit the request, short-circuit with an
// error, call `next` zero or more times, and inspect the result.
//
// send() is const: a pipeline is shared read-only by all copies of a client
// and by concurrent calls. A policy with internal state (e.g. a token cache)
// must synchronize it itself.

class IPolicy {
public:
    virtual ~IPolicy() = default;

    [[nodiscard]] virtual PipelineResult send(
        Context& ctx,
        HttpRequest& request,
        NextPolicy next
    ) const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// TelemetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Sets User-Agent to "[<application-id> ]<package>/<version>" unless the
// request already carries one.

class TelemetryPolicy final : public IPolicy {
public:
    TelemetryPolicy(std::string package_name, std::string package_version,
                    std::string application_id = {});

    [[nodiscard]] PipelineResult send(Context& ctx, HttpRequest& request, NextPolicy next) const override;

    [[nodiscard]] const std::string& user_agent() const noexcept { return user_agent_; }

private:
    std::string user_agent_;
};

// ─────────────────────────────────────────────────────────────────────────────
// RetryStage
// ─────────────────────────────────────────────────────────────────────────────
// Re-runs everything behind it (per-retry policies and the transport) while
// RetryPolicy allows it. Each attempt starts from a fresh copy of the
// request. Retry-After (seconds, capped at max_retry_after) on the failed
// response overrides the backoff delay. Stops early when the context is
// cancelled, including during a wait, or when the wait would overrun its
// deadline.

class RetryStage final : public IPolicy {
public:
    static constexpr std::chrono::milliseconds kDefaultMaxRetryAfter{60'000};

    RetryStage(
        RetryPolicy retry_policy,
        std::shared_ptr<IBackoffPolicy> backoff,
        std::chrono::milliseconds max_retry_after = kDefaultMaxRetryAfter
    );

    [[nodiscard]] PipelineResult send(Context& ctx, HttpRequest& request, NextPolicy next) const override;

    [[nodiscard]] const RetryPolicy& retry_policy() const noexcept { return retry_policy_; }

private:
    [[nodiscard]] std::chrono::milliseconds retry_delay(
        std::size_t attempt,
        const HttpTransportError& error
    ) const;

    RetryPolicy retry_policy_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    std::chrono::milliseconds max_retry_after_;
};

// ─────────────────────────────────────────────────────────────────────────────
// TransportPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Terminal stage: one exchange through IHttpClient. Non-2xx responses become
// HttpTransportError::http_error carrying the response.

class TransportPolicy final : public IPolicy {
public:
    explicit TransportPolicy(std::shared_ptr<IHttpClient> client);

    [[nodiscard]] PipelineResult send(Context& ctx, HttpRequest& request, NextPolicy next) const override;

private:
    std::shared_ptr<IHttpClient> client_;
};

}  // namespace vaultpp
