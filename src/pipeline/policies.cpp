#include "vaultpp/pipeline/policy.hpp"
#include "vaultpp/log/logger.hpp"

#include <algorithm>
#include <charconv>
#include <thread>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// NextPolicy
// ─────────────────────────────────────────────────────────────────────────────

PipelineResult NextPolicy::send(Context& ctx, HttpRequest& request) const {
    if (remaining_.empty()) {
        return tl::unexpected(HttpTransportError::invalid_request(
            "Pipeline ended without a transport stage"));
    }
    return remaining_.front()->send(ctx, request, NextPolicy(remaining_.subspan(1)));
}

// ─────────────────────────────────────────────────────────────────────────────
// TelemetryPolicy
// ─────────────────────────────────────────────────────────────────────────────

TelemetryPolicy::TelemetryPolicy(
    std::string package_name,
    std::string package_version,
    std::string application_id
) {
    if (application_id.empty() == false) {
        user_agent_ = std::move(application_id) + " ";
    }
    user_agent_ += package_name + "/" + package_version;
}

PipelineResult TelemetryPolicy::send(Context& ctx, HttpRequest& request, NextPolicy next) const {
    const bool has_user_agent = get_header(request.headers, "User-Agent").has_value();
    if (has_user_agent == false) {
        request.headers["User-Agent"] = user_agent_;
    }
    return next.send(ctx, request);
}

// ─────────────────────────────────────────────────────────────────────────────
// RetryStage
// ─────────────────────────────────────────────────────────────────────────────

namespace {

constexpr std::chrono::milliseconds kWaitSlice{50};

// Sleeps for `delay` in short slices; false if the context was cancelled first.
bool wait_unless_cancelled(const Context& ctx, std::chrono::milliseconds delay) {
    const auto until = Context::Clock::now() + delay;
    while (true) {
        if (ctx.is_cancelled()) {
            return false;
        }
        const auto now = Context::Clock::now();
        if (now >= until) {
            return true;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
        std::this_thread::sleep_for(std::min(left + std::chrono::milliseconds{1}, kWaitSlice));
    }
}

}  // namespace

RetryStage::RetryStage(
    RetryPolicy retry_policy,
    std::shared_ptr<IBackoffPolicy> backoff,
    std::chrono::milliseconds max_retry_after
)
    : retry_policy_(std::move(retry_policy))
    , backoff_(backoff != nullptr ? std::move(backoff) : std::make_shared<ExponentialBackoff>())
    , max_retry_after_(max_retry_after)
{}

std::chrono::milliseconds RetryStage::retry_delay(
    std::size_t attempt,
    const HttpTransportError& error
) const {
    if (error.response.has_value()) {
        const auto retry_after = get_header(error.response->headers, "Retry-After");
        if (retry_after.has_value()) {
            int seconds = 0;
            const auto* first = retry_after->data();
            const auto* last = first + retry_after->size();
            const auto [ptr, ec] = std::from_chars(first, last, seconds);
            const bool valid = (ec == std::errc{}) && (ptr == last) && (seconds >= 0);
            if (valid) {
                const std::chrono::milliseconds requested = std::chrono::seconds{seconds};
                if (requested > max_retry_after_) {
                    VAULTPP_LOG_DEBUG("Capping Retry-After {}s at {}ms", seconds, max_retry_after_.count());
                    return max_retry_after_;
                }
                return requested;
            }
            VAULTPP_LOG_DEBUG("Ignoring non-numeric Retry-After '{}'", *retry_after);
        }
    }
    return backoff_->next_delay(attempt);
}

PipelineResult RetryStage::send(Context& ctx, HttpRequest& request, NextPolicy next) const {
    for (std::size_t attempt = 0; ; ++attempt) {
        if (ctx.is_cancelled()) {
            return tl::unexpected(HttpTransportError::cancelled());
        }

        HttpRequest attempt_request = request;
        auto result = next.send(ctx, attempt_request);

        if (result.has_value()) {
            backoff_->reset();
            return result;
        }

        const auto& error = result.error();
        if (retry_policy_.should_retry(error, attempt) == false) {
            VAULTPP_LOG_DEBUG("Not retrying after attempt {}: {}", attempt + 1, error.message);
            return result;
        }

        const auto delay = retry_delay(attempt, error);
        const auto remaining = ctx.remaining();
        const bool overruns_deadline = remaining.has_value() && (delay >= *remaining);
        if (overruns_deadline) {
            VAULTPP_LOG_DEBUG("Retry delay {}ms exceeds the remaining {}ms; giving up",
                delay.count(), remaining->count());
            return result;
        }

        VAULTPP_LOG_INFO("Retrying {} in {}ms (retry {}/{}): {}",
            request.url, delay.count(), attempt + 1, retry_policy_.max_attempts(), error.message);
        if (wait_unless_cancelled(ctx, delay) == false) {
            return tl::unexpected(HttpTransportError::cancelled());
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// TransportPolicy
// ─────────────────────────────────────────────────────────────────────────────

TransportPolicy::TransportPolicy(std::shared_ptr<IHttpClient> client)
    : client_(std::move(client))
{}

PipelineResult TransportPolicy::send(Context& ctx, HttpRequest& request, NextPolicy /*next*/) const {
    if (ctx.is_cancelled()) {
        return tl::unexpected(HttpTransportError::cancelled());
    }

    auto result = client_->send(request);
    if (result.has_value() == false) {
        return tl::unexpected(HttpTransportError::from_client_error(result.error()));
    }

    if (result->is_success() == false) {
        return tl::unexpected(HttpTransportError::http_error(std::move(*result)));
    }
    return std::move(*result);
}

}  // namespace vaultpp
