#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcplink {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams
    };

    Code code{Code::InvalidParams};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Outgoing messages
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, Json params = Json::object());
    JsonRpcRequest(std::string method, JsonRpcId id, Json params = Json::object());

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const Json& params() const noexcept;

    /// {"jsonrpc":"2.0","id":...,"method":...,"params":...}
    [[nodiscard]] Json to_json() const;

    /// Validates an incoming request object (used by servers and test fixtures).
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    Json params_;
};

/// Request without an id; the peer sends no response.
class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

struct RpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    /// Reads {code, message, data}; a missing or non-string message becomes "rpc error".
    static RpcError from_json(const Json& node);

    [[nodiscard]] Json to_json() const;
};

/// Pull `result` out of a JSON-RPC response.
///
/// - `error` member present: RpcError (message falls back to "rpc error").
/// - otherwise: the `result` member, or null when absent.
///
/// The response id is not compared with the request id. Correlation is
/// positional because sessions never have more than one request in flight.
[[nodiscard]] tl::expected<Json, RpcError> extract_result(const Json& response);

/// {"jsonrpc":"2.0","id":id,"result":result}
[[nodiscard]] Json make_result_response(const JsonRpcId& id, Json result);

/// {"jsonrpc":"2.0","id":id,"error":{...}}
[[nodiscard]] Json make_error_response(const JsonRpcId& id, const RpcError& error);

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

}  // namespace mcplink
