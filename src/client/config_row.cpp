#include "mcplink/client/config_row.hpp"
#include "mcplink/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>

namespace mcplink {

namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_present(const std::optional<std::string>& value) {
    return value.has_value() && (is_blank(*value) == false);
}

std::optional<Json> parse_json(const std::string& text) {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error&) {
        return std::nullopt;
    }
}

// Strings are taken verbatim; arrays/objects are re-encoded so the row keeps
// its storage shape.
std::optional<std::string> read_text_field(const Json& node, const char* key) {
    const auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_array() || it->is_object()) {
        return it->dump();
    }
    return std::nullopt;
}

std::optional<std::int64_t> read_int_field(const Json& node, const char* key) {
    const auto it = node.find(key);
    if (it == node.end() || it->is_number() == false) {
        return std::nullopt;
    }
    if (it->is_number_float()) {
        const double value = it->get<double>();
        // Bounds chosen so the cast below is always defined.
        if (std::isfinite(value) == false || value < -9.0e18 || value > 9.0e18) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    if (it->is_number_unsigned() &&
        it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

}  // namespace

ClientResult<ServerConfigRow> ServerConfigRow::from_json(const Json& node) {
    if (node.is_object() == false) {
        return tl::unexpected(ClientError::configuration("server config must be a JSON object"));
    }

    ServerConfigRow row;
    const auto transport = read_text_field(node, "transport");
    if (transport.has_value() == false) {
        return tl::unexpected(ClientError::configuration("missing transport"));
    }
    row.transport = *transport;
    row.command = read_text_field(node, "command");
    row.args = read_text_field(node, "args");
    row.env = read_text_field(node, "env");
    row.cwd = read_text_field(node, "cwd");
    row.url = read_text_field(node, "url");
    row.headers = read_text_field(node, "headers");
    row.auth = read_text_field(node, "auth");
    row.heartbeat_sec = read_int_field(node, "heartbeat_sec");
    row.connect_timeout_ms = read_int_field(node, "connect_timeout_ms");
    row.list_tools_timeout_ms = read_int_field(node, "list_tools_timeout_ms");

    const auto enabled_it = node.find("enabled");
    if (enabled_it != node.end()) {
        if (enabled_it->is_boolean()) {
            row.enabled = enabled_it->get<bool>() ? 1 : 0;
        } else if (enabled_it->is_number_integer()) {
            row.enabled = enabled_it->get<std::int64_t>();
        }
    }
    return row;
}

std::chrono::milliseconds normalize_timeout(
    const std::optional<std::int64_t>& timeout_ms,
    std::chrono::milliseconds fallback
) {
    if (timeout_ms.has_value() == false || *timeout_ms < 0) {
        return fallback;
    }
    if (*timeout_ms > kMaxTimeout.count()) {
        return kMaxTimeout;
    }
    return std::chrono::milliseconds{*timeout_ms};
}

std::vector<std::string> parse_args_field(const std::optional<std::string>& encoded) {
    std::vector<std::string> args;
    if (is_present(encoded) == false) {
        return args;
    }
    const auto parsed = parse_json(*encoded);
    if (parsed.has_value() == false || parsed->is_array() == false) {
        MCPLINK_LOG_DEBUG("mcp.row: args is not a JSON array; ignoring");
        return args;
    }
    for (const auto& item : *parsed) {
        if (item.is_string()) {
            args.push_back(item.get<std::string>());
        }
    }
    return args;
}

std::optional<Json> parse_object_field(const std::optional<std::string>& encoded) {
    if (is_present(encoded) == false) {
        return std::nullopt;
    }
    auto parsed = parse_json(*encoded);
    if (parsed.has_value() == false || parsed->is_object() == false) {
        return std::nullopt;
    }
    return parsed;
}

ClientResult<TransportConfig> transport_config_from_row(const ServerConfigRow& row) {
    if (row.enabled == 0) {
        return tl::unexpected(ClientError::configuration("server disabled"));
    }

    const auto connect_timeout = normalize_timeout(row.connect_timeout_ms, kDefaultConnectTimeout);
    const auto list_tools_timeout = normalize_timeout(row.list_tools_timeout_ms, kDefaultListToolsTimeout);

    if (row.transport == "stdio") {
        if (is_present(row.command) == false) {
            return tl::unexpected(ClientError::configuration("missing command"));
        }
        StdioConfig config;
        config.command = *row.command;
        config.args = parse_args_field(row.args);
        config.env = parse_object_field(row.env);
        config.cwd = row.cwd;
        config.connect_timeout = connect_timeout;
        config.list_tools_timeout = list_tools_timeout;
        return TransportConfig{std::move(config)};
    }

    if (row.transport == "http") {
        if (is_present(row.url) == false) {
            return tl::unexpected(ClientError::configuration("missing url"));
        }
        HttpConfig config;
        config.url = *row.url;
        config.headers = parse_object_field(row.headers);
        if (is_present(row.auth)) {
            config.auth_token = row.auth;
        }
        config.connect_timeout = connect_timeout;
        config.list_tools_timeout = list_tools_timeout;
        if (row.heartbeat_sec.has_value()) {
            // Keep-alive pings need a streaming channel, which HTTP sessions do not open.
            get_logger().debug_fmt("mcp.row: heartbeat_sec={} ignored", *row.heartbeat_sec);
        }
        return TransportConfig{std::move(config)};
    }

    return tl::unexpected(ClientError::configuration("unsupported transport: " + row.transport));
}

ClientResult<void> ensure_session_from_row(
    SessionManager& manager,
    std::int64_t id,
    const ServerConfigRow& row
) {
    auto config = transport_config_from_row(row);
    if (!config) {
        get_logger().info_fmt("mcp.row: id={} rejected: {}", id, config.error().message);
        return tl::unexpected(config.error());
    }
    return manager.ensure(id, *config);
}

}  // namespace mcplink
