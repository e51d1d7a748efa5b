#include "vaultpp/secrets/set_secret_builder.hpp"

namespace vaultpp {

SetSecretBuilder::SetSecretBuilder(SecretClient client, std::string name, std::string value)
    : client_(std::move(client))
    , name_(std::move(name))
    , value_(std::move(value))
{}

SetSecretBuilder& SetSecretBuilder::with_properties(SecretProperties properties) {
    options_.properties = std::move(properties);
    return *this;
}

SetSecretBuilder& SetSecretBuilder::with_content_type(std::string content_type) {
    options_.content_type = std::move(content_type);
    return *this;
}

SetSecretBuilder& SetSecretBuilder::with_tags(SecretTags tags) {
    options_.tags = std::move(tags);
    return *this;
}

SetSecretBuilder& SetSecretBuilder::with_tag(std::string key, std::string value) {
    if (options_.tags.has_value() == false) {
        options_.tags.emplace();
    }
    options_.tags->insert_or_assign(std::move(key), std::move(value));
    return *this;
}

SetSecretBuilder& SetSecretBuilder::with_context(Context context) {
    options_.context = std::move(context);
    return *this;
}

SetSecretBuilder& SetSecretBuilder::with_options(SetSecretOptions options) {
    options_ = std::move(options);
    return *this;
}

SecretResult<Response> SetSecretBuilder::send() const {
    return client_.set_secret(name_, value_, options_);
}

std::future<SecretResult<Response>> SetSecretBuilder::async_send() const {
    return client_.async_set_secret(name_, value_, options_);
}

}  // namespace vaultpp
