#pragma once

#include "mcplink/transport.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230.

/// Find a header by name (case-insensitive).
inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

/// Get header value by name (case-insensitive).
inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

/// Insert or replace `name`, removing any differently-cased duplicate first.
inline void set_header(HeaderMap& headers, const std::string& name, const std::string& value) {
    auto it = find_header(headers, name);
    while (it != headers.end()) {
        headers.erase(it);
        it = find_header(headers, name);
    }
    headers[name] = value;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};  // explicit port, or 80/443 by scheme
    std::string path;     // includes leading slash
    std::string query;    // includes '?', may be empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }
};

/// Parse an endpoint URL with ada-url (WHATWG URL Standard).
/// Returns nullopt for unparsable URLs, non-http(s) schemes and empty hosts.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace mcplink
