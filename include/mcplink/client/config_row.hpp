#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Configuration Row
// ═══════════════════════════════════════════════════════════════════════════
// Adapter from a persisted server record to SessionManager calls. The row is
// owned by the caller's storage layer; list-valued fields arrive as
// JSON-encoded strings.

#include "mcplink/client/client_error.hpp"
#include "mcplink/client/session_manager.hpp"
#include "mcplink/session/transport_config.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcplink {

struct ServerConfigRow {
    std::string transport;                 // "stdio" | "http"
    std::optional<std::string> command;
    std::optional<std::string> args;       // JSON array of strings
    std::optional<std::string> env;        // JSON object
    std::optional<std::string> cwd;
    std::optional<std::string> url;
    std::optional<std::string> headers;    // JSON object
    std::optional<std::string> auth;       // bearer token
    std::optional<std::int64_t> heartbeat_sec;
    std::optional<std::int64_t> connect_timeout_ms;
    std::optional<std::int64_t> list_tools_timeout_ms;
    std::int64_t enabled{1};

    /// Read a row from a JSON object. `args`, `env` and `headers` may be
    /// given either JSON-encoded or as native arrays/objects; `enabled` may be
    /// a bool or an integer.
    [[nodiscard]] static ClientResult<ServerConfigRow> from_json(const Json& node);
};

/// Upper bound for any timeout read from a row; keeps deadline arithmetic in range.
inline constexpr std::chrono::milliseconds kMaxTimeout{24 * 60 * 60 * 1000};

/// Missing or negative values fall back to `fallback`; larger than
/// kMaxTimeout is clamped to it.
[[nodiscard]] std::chrono::milliseconds normalize_timeout(
    const std::optional<std::int64_t>& timeout_ms,
    std::chrono::milliseconds fallback
);

/// Decode a JSON string array; invalid JSON or a non-array yields an empty
/// list and non-string elements are skipped.
[[nodiscard]] std::vector<std::string> parse_args_field(const std::optional<std::string>& encoded);

/// Decode a JSON object; anything else yields nullopt.
[[nodiscard]] std::optional<Json> parse_object_field(const std::optional<std::string>& encoded);

/// Validate the row and build the matching TransportConfig.
/// Errors: "server disabled", "unsupported transport: <x>", "missing command",
/// "missing url" (all ClientErrorCode::Configuration).
[[nodiscard]] ClientResult<TransportConfig> transport_config_from_row(const ServerConfigRow& row);

/// transport_config_from_row + SessionManager::ensure. A rejected row never
/// reaches the manager.
[[nodiscard]] ClientResult<void> ensure_session_from_row(
    SessionManager& manager,
    std::int64_t id,
    const ServerConfigRow& row
);

}  // namespace mcplink
