#ifndef VAULTPP_SECRETS_MODELS_HPP
#define VAULTPP_SECRETS_MODELS_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace vaultpp {

using Json = nlohmann::json;

using SecretTags = std::map<std::string, std::string>;

// ─────────────────────────────────────────────────────────────────────────────
// SecretProperties
// ─────────────────────────────────────────────────────────────────────────────

struct SecretProperties {
    std::optional<bool> enabled;

    bool operator==(const SecretProperties&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// SetSecretRequest
// ─────────────────────────────────────────────────────────────────────────────
// Wire body of a set-secret call:
//
//   {"value": "...", "properties": {"enabled": false},
//    "contentType": "text/plain", "tags": {"env": "prod"}}
//
// Every member except `value` is omitted from the JSON when unset.

struct SetSecretRequest {
    std::string value;
    std::optional<SecretProperties> properties;
    std::optional<std::string> content_type;
    std::optional<SecretTags> tags;
};

// ─────────────────────────────────────────────────────────────────────────────
// Secret
// ─────────────────────────────────────────────────────────────────────────────
// Decoded service response. When the body has no "name"/"version" but does
// carry an "id" of the form <vault>/secrets/<name>/<version>, both are taken
// from the id.

struct Secret {
    std::string name;
    std::string version;
    std::optional<std::string> id;
    std::optional<std::string> value;
    std::optional<std::string> content_type;
    std::optional<SecretProperties> properties;
    SecretTags tags;
};

void to_json(Json& j, const SecretProperties& properties);
void from_json(const Json& j, SecretProperties& properties);

void to_json(Json& j, const SetSecretRequest& request);

void from_json(const Json& j, Secret& secret);

}  // namespace vaultpp

#endif  // VAULTPP_SECRETS_MODELS_HPP
