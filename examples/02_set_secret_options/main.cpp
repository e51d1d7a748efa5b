// Example 02: set_secret with an options object
//
// Same call as example 01 through the single-call shape, plus retry and
// logging configuration. The async variant runs a second write alongside.

#include <vaultpp/log/spdlog_logger.hpp>
#include <vaultpp/secrets.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace vaultpp;

int main() {
    std::cout << "=== set_secret (options) ===\n\n";

    const char* url_env = std::getenv("VAULT_URL");
    const char* token_env = std::getenv("VAULT_ACCESS_TOKEN");

    if (!url_env || !token_env) {
        std::cerr << "Please set VAULT_URL and VAULT_ACCESS_TOKEN environment variables\n";
        return 1;
    }

    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    // 1. Configure the client
    SecretClientOptions options;
    options.set_secret_method = HttpMethod::Put;
    options.client
        .with_retry(RetryOptions::exponential({.max_retries = 5, .initial_delay = std::chrono::milliseconds{200}}))
        .with_application_id("vaultpp-example");

    auto client = SecretClient::create(url_env, std::make_shared<StaticTokenCredential>(token_env), options);
    if (!client) {
        std::cerr << "Invalid configuration: " << client.error().message << "\n";
        return 1;
    }

    // 2. Start an async write
    auto pending = client->async_set_secret("secret-name-async", "async-value", {
        .content_type = "text/plain",
    });

    // 3. Synchronous write with a deadline
    Context ctx;
    ctx.with_timeout(std::chrono::seconds{20});

    auto response = client->set_secret("secret-name", "secret-value", {
        .properties = SecretProperties{.enabled = false},
        .tags = SecretTags{{"owner", "examples"}},
        .context = ctx,
    });

    if (!response) {
        std::cerr << "set_secret failed (" << to_string(response.error().code) << "): "
                  << response.error().message << "\n";
    } else if (auto secret = response->json<Secret>()) {
        std::cout << "set " << secret->name << " version " << secret->version << "\n";
    }

    // 4. Collect the async write
    auto async_response = pending.get();
    if (!async_response) {
        std::cerr << "async set_secret failed: " << async_response.error().message << "\n";
        return 1;
    }
    std::cout << "async write returned HTTP " << async_response->status() << "\n";

    return response ? 0 : 1;
}
