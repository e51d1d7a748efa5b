#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// CancellationToken
// ─────────────────────────────────────────────────────────────────────────────
// Shared between the caller and every Context copy that carries it.

class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }

    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Context
// ─────────────────────────────────────────────────────────────────────────────
// Per-call carrier threaded through every pipeline policy:
// - caller entries (string key/value)
// - spans: tracing markers, appended in call order
// - cancellation token and deadline
//
// Client operations copy the caller's context and only ever append a span to
// the copy. Entries the caller put in are never removed or replaced.
//
// Usage:
//   Context ctx;
//   ctx.insert("request-id", "42").with_timeout(std::chrono::seconds{5});
//   auto response = client.set_secret("name", "value").with_context(ctx).send();

class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;

    /// Add or replace one of the caller's entries.
    Context& insert(std::string key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const;

    [[nodiscard]] const std::map<std::string, std::string, std::less<>>& entries() const noexcept {
        return entries_;
    }

    /// Append a tracing marker. Never replaces an earlier span.
    Context& push_span(std::string name);

    [[nodiscard]] const std::vector<std::string>& spans() const noexcept { return spans_; }

    [[nodiscard]] bool has_span(std::string_view name) const;

    Context& with_cancellation(std::shared_ptr<CancellationToken> token);

    Context& with_deadline(Clock::time_point deadline);

    Context& with_timeout(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

    /// Time left before the deadline; nullopt when there is none.
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

    /// True once the token was cancelled or the deadline has passed.
    [[nodiscard]] bool is_cancelled() const;

private:
    std::map<std::string, std::string, std::less<>> entries_;
    std::vector<std::string> spans_;
    std::shared_ptr<CancellationToken> cancellation_;
    std::optional<Clock::time_point> deadline_;
};

}  // namespace vaultpp
