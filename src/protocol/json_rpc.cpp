#include "mcplink/protocol/json_rpc.hpp"

namespace mcplink {
namespace {

constexpr std::string_view kFallbackErrorMessage{"rpc error"};

JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }
    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

}  // namespace

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    Json node;
    std::visit([&node](const auto& v) { node = v; }, value);
    return node;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method, std::int64_t id, Json params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method, JsonRpcId id, Json params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const Json& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    payload["params"] = params_;
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    const auto version_it = payload.find("jsonrpc");
    if (version_it == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }
    if ((version_it->is_string() == false) || (*version_it != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }

    const auto method_it = payload.find("method");
    if (method_it == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }
    if (method_it->is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "method must be a string"});
    }

    const auto id_it = payload.find("id");
    if (id_it == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(*id_it);
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    Json params = Json::object();
    const auto params_it = payload.find("params");
    if (params_it != payload.end() && params_it->is_null() == false) {
        if ((params_it->is_object() == false) && (params_it->is_array() == false)) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "params must be an object or array"});
        }
        params = *params_it;
    }

    return JsonRpcRequest(method_it->get<std::string>(), std::move(*parsed_id), std::move(params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method, std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

RpcError RpcError::from_json(const Json& node) {
    RpcError err;
    err.message = std::string(kFallbackErrorMessage);
    if (node.is_object() == false) {
        return err;
    }
    const auto code_it = node.find("code");
    if (code_it != node.end() && code_it->is_number_integer()) {
        err.code = code_it->get<std::int64_t>();
    }
    const auto message_it = node.find("message");
    if (message_it != node.end() && message_it->is_string()) {
        err.message = message_it->get<std::string>();
    }
    const auto data_it = node.find("data");
    if (data_it != node.end()) {
        err.data = *data_it;
    }
    return err;
}

Json RpcError::to_json() const {
    Json payload = {{"code", code}, {"message", message}};
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

tl::expected<Json, RpcError> extract_result(const Json& response) {
    if (response.is_object() == false) {
        return Json(nullptr);
    }
    const auto error_it = response.find("error");
    if (error_it != response.end()) {
        return tl::unexpected(RpcError::from_json(*error_it));
    }
    const auto result_it = response.find("result");
    if (result_it == response.end()) {
        return Json(nullptr);
    }
    return *result_it;
}

Json make_result_response(const JsonRpcId& id, Json result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id.to_json()},
        {"result", std::move(result)}
    };
}

Json make_error_response(const JsonRpcId& id, const RpcError& error) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id.to_json()},
        {"error", error.to_json()}
    };
}

}  // namespace mcplink
