#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Shared error type for sessions, the probe and the session manager. The
// caller-facing service flattens it to `message`.

#include "mcplink/protocol/json_rpc.hpp"
#include "mcplink/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcplink {

/// Error codes for client operations
enum class ClientErrorCode {
    Configuration,  ///< Rejected before any I/O (empty command, disabled row, ...)
    Connection,     ///< Spawn failure, refused connection, broken pipe, HTTP status
    Protocol,       ///< Malformed response or JSON-RPC `error` object
    Timeout,        ///< A deadline expired
    NotConnected    ///< No cached session for the id
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::Configuration: return "Configuration";
        case ClientErrorCode::Connection:    return "Connection";
        case ClientErrorCode::Protocol:      return "Protocol";
        case ClientErrorCode::Timeout:       return "Timeout";
        case ClientErrorCode::NotConnected:  return "NotConnected";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<RpcError> rpc_error;  ///< Original RPC error if from server

    [[nodiscard]] static ClientError configuration(std::string msg) {
        return {ClientErrorCode::Configuration, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError connection(std::string msg) {
        return {ClientErrorCode::Connection, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol(std::string msg) {
        return {ClientErrorCode::Protocol, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError timeout(std::string msg) {
        return {ClientErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError not_connected(std::string msg = "not connected") {
        return {ClientErrorCode::NotConnected, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(const RpcError& err) {
        return {ClientErrorCode::Protocol, err.message, err};
    }

    [[nodiscard]] static ClientError from_transport(const TransportError& err) {
        switch (err.category) {
            case TransportError::Category::Timeout:
                return timeout(err.message);
            case TransportError::Category::Protocol:
                return protocol(err.message);
            case TransportError::Category::Spawn:
            case TransportError::Category::Network:
                return connection(err.message);
        }
        return connection(err.message);
    }

    /// Same code, message prefixed with `context: `.
    [[nodiscard]] ClientError with_context(std::string_view context) const {
        ClientError copy = *this;
        copy.message = std::string(context) + ": " + message;
        return copy;
    }
};

/// Result type for client operations
template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcplink
