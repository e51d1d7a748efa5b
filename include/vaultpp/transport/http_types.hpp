#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// Header Map and Case-Insensitive Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230.

using HeaderMap = std::unordered_map<std::string, std::string>;

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Put,
    Post,
    Patch,
    Delete
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

// Case-insensitive; nullopt for anything outside HttpMethod.
std::optional<HttpMethod> parse_http_method(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────
// An outgoing request with an absolute URL. Policies in the pipeline may add
// headers; the body is set once by whoever composes the request.

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;                  // absolute, already percent-encoded
    HeaderMap headers;
    std::optional<std::string> body;

    HttpRequest& with_header(const std::string& name, const std::string& value) {
        headers[name] = value;
        return *this;
    }

    HttpRequest& with_body(std::string content) {
        body = std::move(content);
        return *this;
    }

    bool operator==(const HttpRequest&) const = default;
};

// Percent-encode one path segment. RFC 3986 unreserved characters pass
// through; everything else, '/' included, becomes %XX (uppercase hex).
// A segment that is exactly "." or ".." has its dots escaped as %2E.
std::string encode_path_segment(std::string_view segment);

}  // namespace vaultpp
