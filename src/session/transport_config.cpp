#include "mcplink/session/transport_config.hpp"
#include "mcplink/transport/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace mcplink {

namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool starts_with_bearer(std::string_view token) {
    constexpr std::string_view kBearer{"bearer "};
    if (token.size() < kBearer.size()) {
        return false;
    }
    return std::equal(kBearer.begin(), kBearer.end(), token.begin(), [](char a, char b) {
        return a == std::tolower(static_cast<unsigned char>(b));
    });
}

}  // namespace

std::chrono::milliseconds connect_timeout_of(const TransportConfig& config) {
    return std::visit([](const auto& c) { return c.connect_timeout; }, config);
}

std::chrono::milliseconds list_tools_timeout_of(const TransportConfig& config) {
    return std::visit([](const auto& c) { return c.list_tools_timeout; }, config);
}

std::vector<std::pair<std::string, std::string>> string_entries(const std::optional<Json>& object) {
    std::vector<std::pair<std::string, std::string>> entries;
    if (object.has_value() == false || object->is_object() == false) {
        return entries;
    }
    for (const auto& [key, value] : object->items()) {
        if (value.is_string()) {
            entries.emplace_back(key, value.get<std::string>());
        }
    }
    return entries;
}

std::optional<std::string> effective_cwd(const std::optional<std::string>& cwd) {
    if (cwd.has_value() == false || is_blank(*cwd)) {
        return std::nullopt;
    }
    return cwd;
}

HeaderMap build_request_headers(
    const std::optional<Json>& headers,
    const std::optional<std::string>& auth_token
) {
    HeaderMap result;
    result["Content-Type"] = "application/json";
    result["Accept"] = "application/json";

    for (const auto& [name, value] : string_entries(headers)) {
        set_header(result, name, value);
    }

    const bool has_token = auth_token.has_value() && (is_blank(*auth_token) == false);
    const bool has_authorization = (find_header(result, "Authorization") != result.end());
    if (has_token && has_authorization == false) {
        result["Authorization"] = starts_with_bearer(*auth_token) ? *auth_token : "Bearer " + *auth_token;
    }
    return result;
}

}  // namespace mcplink
