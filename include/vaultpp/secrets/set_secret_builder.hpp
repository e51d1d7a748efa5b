#pragma once

#include "vaultpp/secrets/secret_client.hpp"

#include <future>
#include <string>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// SetSecretBuilder
// ─────────────────────────────────────────────────────────────────────────────
// One staged set_secret call. Setters only record; send() executes. The
// builder holds its own copy of the client and owns its options, so it can
// outlive the client it came from and be sent more than once.

class SetSecretBuilder {
public:
    SetSecretBuilder& with_properties(SecretProperties properties);
    SetSecretBuilder& with_content_type(std::string content_type);
    SetSecretBuilder& with_tags(SecretTags tags);
    SetSecretBuilder& with_tag(std::string key, std::string value);
    SetSecretBuilder& with_context(Context context);

    /// Replace every optional setting at once.
    SetSecretBuilder& with_options(SetSecretOptions options);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] const SetSecretOptions& options() const noexcept { return options_; }

    [[nodiscard]] SecretResult<Response> send() const;

    [[nodiscard]] std::future<SecretResult<Response>> async_send() const;

private:
    friend class SecretClient;

    SetSecretBuilder(SecretClient client, std::string name, std::string value);

    SecretClient client_;
    std::string name_;
    std::string value_;
    SetSecretOptions options_;
};

}  // namespace vaultpp
