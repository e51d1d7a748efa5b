#include "vaultpp/transport/http_types.hpp"

#include <array>

namespace vaultpp {

std::optional<HttpMethod> parse_http_method(std::string_view name) {
    std::string upper(name);
    std::ranges::transform(upper, upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    constexpr std::array methods{
        HttpMethod::Get, HttpMethod::Put, HttpMethod::Post,
        HttpMethod::Patch, HttpMethod::Delete
    };
    for (const auto method : methods) {
        if (to_string(method) == upper) {
            return method;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Path Segment Encoding
// ─────────────────────────────────────────────────────────────────────────────

std::string encode_path_segment(std::string_view segment) {
    constexpr std::string_view hex = "0123456789ABCDEF";

    // "." and ".." would otherwise be removed as dot segments by libcurl
    const bool dot_segment = (segment == ".") || (segment == "..");

    std::string encoded;
    encoded.reserve(segment.size());
    for (const char ch : segment) {
        const auto c = static_cast<unsigned char>(ch);
        const bool unreserved = std::isalnum(c) || c == '-' || c == '_' || c == '~' ||
                                (c == '.' && dot_segment == false);
        if (unreserved) {
            encoded += ch;
            continue;
        }
        encoded += '%';
        encoded += hex[c >> 4];
        encoded += hex[c & 0x0F];
    }
    return encoded;
}

}  // namespace vaultpp
