#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Per-call connection parameters for the two server kinds. Built by callers
// (or the config-row adapter), consumed by the session factories, never
// stored by the manager.

#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/transport.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mcplink {

struct StdioConfig {
    std::string command;
    std::vector<std::string> args;

    /// JSON object; only string-valued entries reach the child.
    std::optional<Json> env;

    /// Blank values are ignored.
    std::optional<std::string> cwd;

    std::chrono::milliseconds connect_timeout{kDefaultConnectTimeout};
    std::chrono::milliseconds list_tools_timeout{kDefaultListToolsTimeout};

    StdioConfig& with_arg(std::string arg) {
        args.push_back(std::move(arg));
        return *this;
    }

    StdioConfig& with_env(const std::string& name, std::string value) {
        if (env.has_value() == false || env->is_object() == false) {
            env = Json::object();
        }
        (*env)[name] = std::move(value);
        return *this;
    }

    StdioConfig& with_cwd(std::string dir) {
        cwd = std::move(dir);
        return *this;
    }

    StdioConfig& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }

    StdioConfig& with_list_tools_timeout(std::chrono::milliseconds timeout) {
        list_tools_timeout = timeout;
        return *this;
    }
};

struct HttpConfig {
    std::string url;

    /// JSON object; only string-valued entries are sent.
    std::optional<Json> headers;

    /// Turned into `Authorization: Bearer <token>` unless headers already
    /// carry an Authorization entry.
    std::optional<std::string> auth_token;

    std::chrono::milliseconds connect_timeout{kDefaultConnectTimeout};
    std::chrono::milliseconds list_tools_timeout{kDefaultListToolsTimeout};

    bool verify_ssl{true};

    HttpConfig& with_header(const std::string& name, std::string value) {
        if (headers.has_value() == false || headers->is_object() == false) {
            headers = Json::object();
        }
        (*headers)[name] = std::move(value);
        return *this;
    }

    HttpConfig& with_bearer_token(std::string token) {
        auth_token = std::move(token);
        return *this;
    }

    HttpConfig& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }

    HttpConfig& with_list_tools_timeout(std::chrono::milliseconds timeout) {
        list_tools_timeout = timeout;
        return *this;
    }
};

using TransportConfig = std::variant<StdioConfig, HttpConfig>;

[[nodiscard]] std::chrono::milliseconds connect_timeout_of(const TransportConfig& config);
[[nodiscard]] std::chrono::milliseconds list_tools_timeout_of(const TransportConfig& config);

/// String-valued members of a JSON object, in iteration order. Anything that
/// is not an object yields an empty list.
[[nodiscard]] std::vector<std::pair<std::string, std::string>> string_entries(const std::optional<Json>& object);

/// nullopt for missing, empty or whitespace-only directories.
[[nodiscard]] std::optional<std::string> effective_cwd(const std::optional<std::string>& cwd);

/// Headers for every POST: JSON defaults, then caller headers (case-insensitive
/// override), then a synthesized bearer Authorization header when none exists.
[[nodiscard]] HeaderMap build_request_headers(
    const std::optional<Json>& headers,
    const std::optional<std::string>& auth_token
);

}  // namespace mcplink
