#include "vaultpp/secrets/models.hpp"

#include <string_view>

namespace vaultpp {

namespace {

// "https://v.example/secrets/<name>/<version>" -> {name, version}
void split_secret_id(std::string_view id, std::string& name, std::string& version) {
    constexpr std::string_view marker = "/secrets/";
    const auto start = id.find(marker);
    if (start == std::string_view::npos) {
        return;
    }
    auto rest = id.substr(start + marker.size());
    const auto query = rest.find('?');
    if (query != std::string_view::npos) {
        rest = rest.substr(0, query);
    }

    const auto slash = rest.find('/');
    if (name.empty()) {
        name = std::string(rest.substr(0, slash));
    }
    const bool has_version = (slash != std::string_view::npos) && version.empty();
    if (has_version) {
        version = std::string(rest.substr(slash + 1));
    }
}

}  // namespace

void to_json(Json& j, const SecretProperties& properties) {
    j = Json::object();
    if (properties.enabled.has_value()) {
        j["enabled"] = *properties.enabled;
    }
}

void from_json(const Json& j, SecretProperties& properties) {
    const auto it = j.find("enabled");
    if (it != j.end() && it->is_boolean()) {
        properties.enabled = it->get<bool>();
    }
}

void to_json(Json& j, const SetSecretRequest& request) {
    j = Json{{"value", request.value}};
    if (request.properties.has_value()) {
        j["properties"] = *request.properties;
    }
    if (request.content_type.has_value()) {
        j["contentType"] = *request.content_type;
    }
    if (request.tags.has_value()) {
        j["tags"] = *request.tags;
    }
}

void from_json(const Json& j, Secret& secret) {
    secret.name = j.value("name", std::string{});
    secret.version = j.value("version", std::string{});

    if (j.contains("id") && j.at("id").is_string()) {
        secret.id = j.at("id").get<std::string>();
        split_secret_id(*secret.id, secret.name, secret.version);
    }
    if (j.contains("value") && j.at("value").is_string()) {
        secret.value = j.at("value").get<std::string>();
    }
    if (j.contains("contentType") && j.at("contentType").is_string()) {
        secret.content_type = j.at("contentType").get<std::string>();
    }

    // Key Vault calls the properties object "attributes"
    for (const char* key : {"properties", "attributes"}) {
        if (j.contains(key) && j.at(key).is_object()) {
            secret.properties = j.at(key).get<SecretProperties>();
            break;
        }
    }

    if (j.contains("tags") && j.at("tags").is_object()) {
        secret.tags = j.at("tags").get<SecretTags>();
    }
}

}  // namespace vaultpp
