#ifndef VAULTPP_SECRETS_SECRET_CLIENT_OPTIONS_HPP
#define VAULTPP_SECRETS_SECRET_CLIENT_OPTIONS_HPP

#include "vaultpp/pipeline/client_options.hpp"
#include "vaultpp/pipeline/context.hpp"
#include "vaultpp/secrets/models.hpp"
#include "vaultpp/transport/http_types.hpp"

#include <optional>
#include <string>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// SecretClientOptions
// ─────────────────────────────────────────────────────────────────────────────
// Construction-time settings. Fixed for the lifetime of the client.

struct SecretClientOptions {
    // Sent as the api-version query parameter on every request.
    std::string api_version{"7.5"};

    // OAuth scope requested from the credential.
    std::string scope{"https://vault.azure.net/.default"};

    // HTTP method used by set_secret. Key Vault itself expects PUT.
    HttpMethod set_secret_method{HttpMethod::Get};

    ClientOptions client;
};

// ─────────────────────────────────────────────────────────────────────────────
// SetSecretOptions
// ─────────────────────────────────────────────────────────────────────────────
// Optional settings for one set_secret call. Unset members leave the
// corresponding part of the request at its default; the client reads the
// bag and never keeps it.
//
//   client.set_secret("name", "value", {
//       .properties = SecretProperties{.enabled = false},
//       .tags = SecretTags{{"env", "prod"}},
//   });

struct SetSecretOptions {
    std::optional<SecretProperties> properties;
    std::optional<std::string> content_type;
    std::optional<SecretTags> tags;
    std::optional<Context> context;
};

}  // namespace vaultpp

#endif  // VAULTPP_SECRETS_SECRET_CLIENT_OPTIONS_HPP
