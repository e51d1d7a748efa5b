// ─────────────────────────────────────────────────────────────────────────────
// vault-cli - Secret store command-line tool
// ─────────────────────────────────────────────────────────────────────────────
// Stores a secret through vaultpp::SecretClient and prints what the vault
// returned.
//
// Usage:
//   vault-cli --url https://my-vault.example/ --name db-password --value hunter2
//
//   # Token from the environment, PUT as Key Vault expects
//   export VAULT_URL=https://my-vault.example/ VAULT_ACCESS_TOKEN=eyJ...
//   vault-cli -n db-password -V hunter2 --method PUT --tag env=prod --disabled
//
// Features:
//   - Content type, tags and the enabled flag
//   - Configurable HTTP method, api-version and retry count
//   - JSON output for scripting
//   - Verbose pipeline logging through spdlog

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "vaultpp/log/spdlog_logger.hpp"
#include "vaultpp/secrets.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace vaultpp;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_field(const std::string& label, const std::string& value) {
    std::cout << "  " << color::c(color::dim) << label << ": " << color::c(color::reset) << value << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

// Parse "key=value"; nullopt when there is no '=' or the key is empty
std::optional<std::pair<std::string, std::string>> parse_tag(const std::string& tag) {
    auto eq_pos = tag.find('=');
    if (eq_pos == std::string::npos || eq_pos == 0) {
        return std::nullopt;
    }
    return std::make_pair(tag.substr(0, eq_pos), tag.substr(eq_pos + 1));
}

// Get environment variable with fallback
std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

void print_failure(const SecretError& error, bool json_output) {
    if (json_output) {
        nlohmann::json out = {
            {"error", std::string(to_string(error.code))},
            {"message", error.message},
        };
        if (auto status = error.http_status()) {
            out["status"] = *status;
        }
        if (error.transport && error.transport->response) {
            out["body"] = error.transport->response->body;
        }
        std::cout << out.dump(2) << "\n";
        return;
    }

    print_error(std::string(to_string(error.code)) + ": " + error.message);
    if (error.transport && error.transport->response && !error.transport->response->body.empty()) {
        std::cerr << color::c(color::dim) << error.transport->response->body << color::c(color::reset) << "\n";
    }
}

int print_result(const Response& response, bool json_output) {
    if (json_output) {
        nlohmann::json out = {{"status", response.status()}};
        auto body = nlohmann::json::parse(response.body(), nullptr, false);
        out["body"] = body.is_discarded() ? nlohmann::json(response.body()) : body;
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    auto secret = response.json<Secret>();
    if (!secret) {
        print_success("HTTP " + std::to_string(response.status()));
        print_field("body", response.body());
        return 0;
    }

    print_success("Stored " + secret->name);
    print_field("version", secret->version.empty() ? "(none)" : secret->version);
    if (secret->id) {
        print_field("id", *secret->id);
    }
    if (secret->properties && secret->properties->enabled) {
        print_field("enabled", *secret->properties->enabled ? "true" : "false");
    }
    for (const auto& [key, value] : secret->tags) {
        print_field("tag", key + "=" + value);
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("vault-cli", "Store a secret in a vault");

    options.add_options()
        // Connection
        ("u,url", "Vault endpoint (or use VAULT_URL env var)", cxxopts::value<std::string>())
        ("t,token", "Bearer token (or use VAULT_ACCESS_TOKEN env var)", cxxopts::value<std::string>())
        ("api-version", "api-version query parameter", cxxopts::value<std::string>()->default_value("7.5"))
        ("m,method", "HTTP method for the write (GET, PUT, POST, PATCH)", cxxopts::value<std::string>()->default_value("GET"))
        ("r,retries", "Maximum number of retries", cxxopts::value<std::size_t>()->default_value("3"))

        // Secret
        ("n,name", "Secret name", cxxopts::value<std::string>())
        ("V,value", "Secret value", cxxopts::value<std::string>())
        ("content-type", "Content type stored with the secret", cxxopts::value<std::string>())
        ("tag", "Tag to attach (can be repeated, format: 'key=value')", cxxopts::value<std::vector<std::string>>())
        ("disabled", "Store the secret disabled")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable verbose logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << color::c(color::bold) << "  Store a secret:\n" << color::c(color::reset);
            std::cout << "    vault-cli -u https://my-vault.example/ -t eyJ... -n db-password -V hunter2\n\n";
            std::cout << color::c(color::bold) << "  With metadata:\n" << color::c(color::reset);
            std::cout << "    vault-cli -n api-key -V s3cr3t --content-type text/plain --tag env=prod --tag team=core\n";
            std::cout << "    # Or with environment variables:\n";
            std::cout << "    export VAULT_URL=https://my-vault.example/ VAULT_ACCESS_TOKEN=eyJ...\n";
            return 0;
        }

        // Setup
        color::enabled = !result.count("no-color");
        bool json_output = result.count("json") > 0;

        if (result.count("verbose")) {
            set_logger(make_spdlog_console_logger(LogLevel::Debug));
        }

        std::string url = result.count("url") ? result["url"].as<std::string>() : get_env("VAULT_URL");
        if (url.empty()) {
            print_error("No endpoint. Use --url or set VAULT_URL");
            return 1;
        }

        if (!result.count("name") || !result.count("value")) {
            print_error("--name and --value are required");
            return 1;
        }

        auto method = parse_http_method(result["method"].as<std::string>());
        if (!method) {
            print_error("Unknown HTTP method: " + result["method"].as<std::string>());
            return 1;
        }

        std::shared_ptr<const TokenCredential> credential;
        if (result.count("token")) {
            credential = std::make_shared<StaticTokenCredential>(result["token"].as<std::string>());
        } else {
            credential = std::make_shared<EnvironmentTokenCredential>();
        }

        // Build the client
        auto builder = SecretClient::builder(url, credential);
        if (!builder) {
            print_error(builder.error().message);
            return 1;
        }
        builder->with_api_version(result["api-version"].as<std::string>())
                .with_set_secret_method(*method)
                .with_retry(RetryOptions::exponential({.max_retries = result["retries"].as<std::size_t>()}))
                .with_application_id("vault-cli");
        auto client = builder->build();

        // Stage the call
        auto call = client.set_secret(result["name"].as<std::string>(), result["value"].as<std::string>());

        if (result.count("content-type")) {
            call.with_content_type(result["content-type"].as<std::string>());
        }
        if (result.count("disabled")) {
            call.with_properties(SecretProperties{.enabled = false});
        }
        if (result.count("tag")) {
            for (const auto& tag : result["tag"].as<std::vector<std::string>>()) {
                auto parsed = parse_tag(tag);
                if (!parsed) {
                    print_error("Invalid tag '" + tag + "', expected key=value");
                    return 1;
                }
                call.with_tag(parsed->first, parsed->second);
            }
        }

        Context ctx;
        ctx.insert("tool", "vault-cli");
        call.with_context(ctx);

        auto response = call.send();
        if (!response) {
            print_failure(response.error(), json_output);
            return 1;
        }
        return print_result(*response, json_output);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
