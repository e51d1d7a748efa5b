#ifndef VAULTPP_TESTS_MOCKS_MOCK_CREDENTIAL_HPP
#define VAULTPP_TESTS_MOCKS_MOCK_CREDENTIAL_HPP

#include "vaultpp/credential/token_credential.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace vaultpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// CountingCredential - TokenCredential that counts get_token calls
// ─────────────────────────────────────────────────────────────────────────────
// Hands out "token-1", "token-2", ... each valid for `lifetime`. A
// lifetime under BearerTokenPolicy::kRefreshMargin forces a refresh on
// every request.

class CountingCredential final : public TokenCredential {
public:
    explicit CountingCredential(std::chrono::seconds lifetime = std::chrono::hours{1})
        : lifetime_(lifetime) {}

    CredentialResult<AccessToken> get_token(
        const std::vector<std::string>& scopes,
        const Context& /*ctx*/
    ) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_scopes_ = scopes;
        }
        if (fail_.load()) {
            return tl::unexpected(CredentialError{"token endpoint unavailable"});
        }
        const int n = ++calls_;
        return AccessToken{"token-" + std::to_string(n), std::chrono::system_clock::now() + lifetime_};
    }

    void set_failing(bool fail) { fail_.store(fail); }

    [[nodiscard]] int calls() const { return calls_.load(); }

    [[nodiscard]] std::vector<std::string> last_scopes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_scopes_;
    }

private:
    std::chrono::seconds lifetime_;
    mutable std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    mutable std::vector<std::string> last_scopes_;
    std::atomic<bool> fail_{false};
};

}  // namespace vaultpp::testing

#endif  // VAULTPP_TESTS_MOCKS_MOCK_CREDENTIAL_HPP
