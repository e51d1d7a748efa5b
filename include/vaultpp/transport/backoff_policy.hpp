#ifndef VAULTPP_TRANSPORT_BACKOFF_POLICY_HPP
#define VAULTPP_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long to wait before retry number `attempt` (0-indexed). One instance
// is shared by every call going through a pipeline, so implementations must
// be thread-safe.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    // Called after a successful attempt.
    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(initial * multiplier^attempt, max) * U(1 - jitter, 1 + jitter)
//
// With the defaults (800ms, x2, 60s cap, 20% jitter):
//   attempt 0: ~800ms, attempt 1: ~1.6s, attempt 2: ~3.2s ... capped at ~60s

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{800},
              2.0,
              std::chrono::milliseconds{60'000},
              0.2
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds initial,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor  // 0.0 disables jitter
    )
        : initial_(initial)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_factor_(std::clamp(jitter_factor, 0.0, 1.0))
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double grown_ms = static_cast<double>(initial_.count()) *
                                std::pow(multiplier_, static_cast<double>(attempt));
        const double capped_ms = std::min(grown_ms, static_cast<double>(max_.count()));
        const double jittered_ms = capped_ms * jitter_multiplier();
        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, jittered_ms))};
    }

    void reset() override {}

    [[nodiscard]] std::chrono::milliseconds initial_delay() const noexcept { return initial_; }
    [[nodiscard]] std::chrono::milliseconds max_delay() const noexcept { return max_; }

private:
    double jitter_multiplier() {
        if (jitter_factor_ <= 0.0) {
            return 1.0;
        }
        std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        return dist(rng_);
    }

    std::chrono::milliseconds initial_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// Same delay before every retry.
class FixedBackoff : public IBackoffPolicy {
public:
    explicit FixedBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

// Zero delay, for tests.
class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }

    void reset() override {}
};

}  // namespace vaultpp

#endif  // VAULTPP_TRANSPORT_BACKOFF_POLICY_HPP
