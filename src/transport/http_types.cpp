#include "mcplink/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace mcplink {

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    // ada returns "https:" - drop the colon
    std::string scheme = std::string(ada_url.get_protocol());
    if ((scheme.empty() == false) && (scheme.back() == ':')) {
        scheme.pop_back();
    }

    const bool is_https = (scheme == "https");
    if ((scheme != "http") && (is_https == false)) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_str = ada_url.get_port();
    if (port_str.empty() == false) {
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
    }

    std::string path = std::string(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

}  // namespace mcplink
