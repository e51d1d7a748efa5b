#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// vaultpp secrets
// ═══════════════════════════════════════════════════════════════════════════
// Everything an application needs to talk to the secrets collection:
//
//   auto credential = std::make_shared<vaultpp::EnvironmentTokenCredential>();
//   auto client = vaultpp::SecretClient::create("https://my.vault/", credential);
//   auto response = client->set_secret("name", "value").send();
//
// The spdlog backend is opt-in: include "vaultpp/log/spdlog_logger.hpp".

#include "vaultpp/credential/token_credential.hpp"
#include "vaultpp/log/logger.hpp"
#include "vaultpp/pipeline/client_options.hpp"
#include "vaultpp/pipeline/context.hpp"
#include "vaultpp/pipeline/pipeline.hpp"
#include "vaultpp/secrets/models.hpp"
#include "vaultpp/secrets/response.hpp"
#include "vaultpp/secrets/secret_client.hpp"
#include "vaultpp/secrets/secret_client_options.hpp"
#include "vaultpp/secrets/secret_error.hpp"
#include "vaultpp/secrets/set_secret_builder.hpp"
#include "vaultpp/version.hpp"
