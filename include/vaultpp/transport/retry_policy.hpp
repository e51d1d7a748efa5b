#ifndef VAULTPP_TRANSPORT_RETRY_POLICY_HPP
#define VAULTPP_TRANSPORT_RETRY_POLICY_HPP

#include "vaultpp/transport/transport_error.hpp"

#include <cstddef>
#include <set>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides *whether* a failed attempt is retried; IBackoffPolicy decides how
// long to wait first.
//
// Default behavior:
// - Retry on: connection failures, timeouts, 408, 429, 500, 502, 503, 504
// - Never retry: SSL errors (unless enabled), auth failures, cancellation,
//   requests rejected before sending, other 4xx

class RetryPolicy {
public:
    RetryPolicy()
        : max_attempts_(3)
        , retry_on_connection_error_(true)
        , retry_on_timeout_(true)
        , retry_on_ssl_error_(false)
        , retryable_http_statuses_{408, 429, 500, 502, 503, 504}
    {}

    /// Maximum number of retries, not counting the initial attempt.
    RetryPolicy& with_max_attempts(std::size_t attempts) {
        max_attempts_ = attempts;
        return *this;
    }

    RetryPolicy& with_retry_on_connection_error(bool enable) {
        retry_on_connection_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_timeout(bool enable) {
        retry_on_timeout_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_ssl_error(bool enable) {
        retry_on_ssl_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retryable_status(int status_code) {
        retryable_http_statuses_.insert(status_code);
        return *this;
    }

    RetryPolicy& without_retryable_status(int status_code) {
        retryable_http_statuses_.erase(status_code);
        return *this;
    }

    [[nodiscard]] std::size_t max_attempts() const noexcept {
        return max_attempts_;
    }

    /// @param attempt 0 = first retry after the initial failure
    [[nodiscard]] bool should_retry(HttpTransportError::Code code, std::size_t attempt) const {
        const bool within_limit = (attempt < max_attempts_);
        if (within_limit == false) {
            return false;
        }

        switch (code) {
            case HttpTransportError::Code::ConnectionFailed:
                return retry_on_connection_error_;

            case HttpTransportError::Code::Timeout:
                return retry_on_timeout_;

            case HttpTransportError::Code::SslError:
                return retry_on_ssl_error_;

            case HttpTransportError::Code::Cancelled:
            case HttpTransportError::Code::Authentication:
            case HttpTransportError::Code::InvalidRequest:
            case HttpTransportError::Code::HttpError:  // see should_retry(const HttpTransportError&, ...)
                return false;
        }

        return false;
    }

    [[nodiscard]] bool should_retry_http_status(int status_code) const {
        return retryable_http_statuses_.contains(status_code);
    }

    /// Combined check used by the pipeline: error category, then status code.
    [[nodiscard]] bool should_retry(const HttpTransportError& error, std::size_t attempt) const {
        if (should_retry(error.code, attempt)) {
            return true;
        }

        const bool is_http_error = (error.code == HttpTransportError::Code::HttpError);
        const bool has_status = error.http_status.has_value();
        if (is_http_error && has_status) {
            const bool within_limit = (attempt < max_attempts_);
            return within_limit && should_retry_http_status(*error.http_status);
        }
        return false;
    }

private:
    std::size_t max_attempts_;
    bool retry_on_connection_error_;
    bool retry_on_timeout_;
    bool retry_on_ssl_error_;
    std::set<int> retryable_http_statuses_;
};

}  // namespace vaultpp

#endif  // VAULTPP_TRANSPORT_RETRY_POLICY_HPP
