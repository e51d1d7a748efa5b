#include "vaultpp/pipeline/context.hpp"

#include <algorithm>

namespace vaultpp {

Context& Context::insert(std::string key, std::string value) {
    entries_.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

std::optional<std::string> Context::get(std::string_view key) const {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Context::contains(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

Context& Context::push_span(std::string name) {
    spans_.push_back(std::move(name));
    return *this;
}

bool Context::has_span(std::string_view name) const {
    return std::ranges::find(spans_, name) != spans_.end();
}

Context& Context::with_cancellation(std::shared_ptr<CancellationToken> token) {
    cancellation_ = std::move(token);
    return *this;
}

Context& Context::with_deadline(Clock::time_point deadline) {
    // A nested deadline can only tighten the outer one
    const bool has_earlier = deadline_.has_value() && (*deadline_ < deadline);
    if (has_earlier == false) {
        deadline_ = deadline;
    }
    return *this;
}

Context& Context::with_timeout(std::chrono::milliseconds timeout) {
    return with_deadline(Clock::now() + timeout);
}

std::optional<std::chrono::milliseconds> Context::remaining() const {
    if (deadline_.has_value() == false) {
        return std::nullopt;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

bool Context::is_cancelled() const {
    const bool token_cancelled = (cancellation_ != nullptr) && cancellation_->is_cancelled();
    if (token_cancelled) {
        return true;
    }
    return deadline_.has_value() && (Clock::now() >= *deadline_);
}

}  // namespace vaultpp
