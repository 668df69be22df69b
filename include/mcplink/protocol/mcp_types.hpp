#ifndef MCPLINK_PROTOCOL_MCP_TYPES_HPP
#define MCPLINK_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcplink {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Protocol constants
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

inline constexpr const char* kMethodInitialize = "initialize";
inline constexpr const char* kMethodToolsList = "tools/list";
inline constexpr const char* kMethodToolsCall = "tools/call";
inline constexpr const char* kNotificationInitialized = "notifications/initialized";

inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{5'000};
inline constexpr std::chrono::milliseconds kDefaultListToolsTimeout{5'000};
inline constexpr std::chrono::milliseconds kDefaultToolCallTimeout{20'000};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }
};

/// Identity this library reports in `initialize`.
[[nodiscard]] Implementation client_implementation();

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    Implementation client_info = client_implementation();

    /// Capabilities are always sent as an empty object.
    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", Json::object()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct ToolDescriptor {
    std::string name;
    std::optional<std::string> description;
    std::optional<Json> input_schema;  // always a JSON object when present

    /// Serialized with the camelCase `inputSchema` key; absent fields are
    /// emitted as null (description) or omitted (inputSchema).
    [[nodiscard]] Json to_json() const;

    bool operator==(const ToolDescriptor&) const = default;
};

/// Parse the `result` of a tools/list call.
///
/// A missing or non-array `tools` member yields an empty list. Entries
/// without a string `name` are skipped. `description` is kept only when it is
/// a string. The input schema is read from `inputSchema`, falling back to
/// `input_schema` only when `inputSchema` is absent; a non-object schema is
/// dropped.
[[nodiscard]] std::vector<ToolDescriptor> parse_tools(const Json& result);

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }
};

/// Flatten the `content` of a tools/call result into text.
///
/// - string `content`: returned as-is
/// - array `content`: `text` of every block whose `type` is "text", joined by '\n'
/// - anything else: empty string
[[nodiscard]] std::string extract_text_content(const Json& result);

// ═══════════════════════════════════════════════════════════════════════════
// Probe result
// ═══════════════════════════════════════════════════════════════════════════

struct CheckResult {
    bool ok{false};
    std::optional<std::uint32_t> tools_count;
    std::optional<std::vector<ToolDescriptor>> tools;
    std::optional<std::string> warning;
    std::optional<std::string> error;

    [[nodiscard]] static CheckResult failure(std::string message) {
        CheckResult result;
        result.error = std::move(message);
        return result;
    }

    [[nodiscard]] static CheckResult success(std::vector<ToolDescriptor> tools) {
        CheckResult result;
        result.ok = true;
        result.tools_count = static_cast<std::uint32_t>(tools.size());
        result.tools = std::move(tools);
        return result;
    }

    /// {"ok", "tools_count", "tools", "warning", "error"}; absent optionals are null.
    [[nodiscard]] Json to_json() const;
};

}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_MCP_TYPES_HPP
