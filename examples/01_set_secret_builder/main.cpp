// Example 01: set_secret with the staged builder
//
// Stores one secret, disabled, and prints the version the vault assigned.

#include <vaultpp/secrets.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace vaultpp;

int main() {
    std::cout << "=== set_secret (builder) ===\n\n";

    const char* url_env = std::getenv("VAULT_URL");
    if (!url_env) {
        std::cerr << "Please set VAULT_URL environment variable\n";
        std::cerr << "Example: export VAULT_URL=\"https://my-vault.vault.azure.net/\"\n";
        return 1;
    }

    // Reads VAULT_ACCESS_TOKEN on first use
    auto credential = std::make_shared<EnvironmentTokenCredential>();

    // 1. Build the client
    auto client = SecretClient::create(url_env, credential);
    if (!client) {
        std::cerr << "Invalid configuration: " << client.error().message << "\n";
        return 1;
    }
    std::cout << "Endpoint: " << client->endpoint() << "\n\n";

    // 2. Stage the call; nothing is sent yet
    Context ctx;
    ctx.insert("example", "01_set_secret_builder");

    auto call = client->set_secret("secret-name", "secret-value")
                    .with_properties(SecretProperties{.enabled = false})
                    .with_context(ctx);

    // 3. Send
    auto response = call.send();
    if (!response) {
        std::cerr << "set_secret failed: " << response.error().message << "\n";
        if (const auto status = response.error().http_status()) {
            std::cerr << "HTTP status: " << *status << "\n";
        }
        return 1;
    }

    // 4. Decode
    auto secret = response->json<Secret>();
    if (!secret) {
        std::cerr << "Unexpected response: " << secret.error().message << "\n";
        return 1;
    }

    std::cout << "set " << secret->name << " version " << secret->version << "\n";
    return 0;
}
