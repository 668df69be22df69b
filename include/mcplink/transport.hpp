#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared by the process transport, the HTTP client and both session kinds.

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcplink {

using Json = nlohmann::json;
using HeaderMap = std::unordered_map<std::string, std::string>;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Spawn,     // process could not be started (exec, chdir, pipes, deadline)
        Network,   // I/O failure, peer closed, connection refused, HTTP status
        Timeout,   // a write/read/round-trip deadline expired
        Protocol   // peer answered with something that is not a JSON-RPC document
    };

    Category category{};
    std::string message;
    std::optional<int> status_code{};

    static TransportError spawn(std::string msg) {
        return {Category::Spawn, std::move(msg), std::nullopt};
    }
    static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg), std::nullopt};
    }
    static TransportError timeout(std::string msg) {
        return {Category::Timeout, std::move(msg), std::nullopt};
    }
    static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg), std::nullopt};
    }
    static TransportError http_status(int status, std::string msg) {
        return {Category::Network, std::move(msg), status};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Spawn:    return "Spawn";
        case TransportError::Category::Network:  return "Network";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Protocol: return "Protocol";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcplink
