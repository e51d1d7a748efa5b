#pragma once

#include "vaultpp/pipeline/client_options.hpp"
#include "vaultpp/pipeline/context.hpp"
#include "vaultpp/pipeline/policy.hpp"

#include <string_view>
#include <vector>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// Pipeline
// ─────────────────────────────────────────────────────────────────────────────
// Fixed, ordered chain of policies ending in the transport:
//
//   options.per_call_policies
//   per_call_policies            (from the service client)
//   TelemetryPolicy
//   RetryStage                   ─┐ everything below runs once per attempt
//   options.per_retry_policies    │
//   per_retry_policies            │ (e.g. bearer-token auth)
//   TransportPolicy              ─┘
//
// Immutable once constructed; send() may be called concurrently.

class Pipeline {
public:
    Pipeline(
        std::string_view package_name,
        std::string_view package_version,
        const ClientOptions& options,
        std::vector<PolicyPtr> per_call_policies,
        std::vector<PolicyPtr> per_retry_policies
    );

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    [[nodiscard]] PipelineResult send(Context& ctx, HttpRequest& request) const;

    [[nodiscard]] std::size_t size() const noexcept { return policies_.size(); }

private:
    std::vector<PolicyPtr> policies_;
};

}  // namespace vaultpp
