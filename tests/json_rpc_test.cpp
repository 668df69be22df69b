#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcplink/protocol/json_rpc.hpp"

using json = nlohmann::json;

TEST_CASE("JsonRpcRequest serializes integer ids and params", "[json-rpc][request]") {
    auto params = json::object({{"name", "echo"}, {"arguments", {{"text", "hi"}}}});
    mcplink::JsonRpcRequest request{"tools/call", std::int64_t{42}, params};

    auto j = request.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["method"] == "tools/call");
    REQUIRE(j["id"] == 42);
    REQUIRE(j["id"].is_number_integer());
    REQUIRE(j["params"] == params);
}

TEST_CASE("JsonRpcRequest always carries params", "[json-rpc][request]") {
    mcplink::JsonRpcRequest request{"tools/list", std::int64_t{1}};
    auto j = request.to_json();

    REQUIRE(j.contains("params"));
    REQUIRE(j["params"] == json::object());
}

TEST_CASE("JsonRpcRequest parses incoming payloads", "[json-rpc][request]") {
    json payload = {
        {"jsonrpc", "2.0"},
        {"method", "initialize"},
        {"id", "req-001"},
        {"params", {{"protocolVersion", "2024-11-05"}}}
    };

    auto parsed = mcplink::JsonRpcRequest::from_json(payload);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->method() == "initialize");
    REQUIRE(std::holds_alternative<std::string>(parsed->id().value));
    REQUIRE(std::get<std::string>(parsed->id().value) == "req-001");
    REQUIRE(parsed->params()["protocolVersion"] == "2024-11-05");
}

TEST_CASE("JsonRpcRequest parsing surfaces detailed errors", "[json-rpc][request][error]") {
    SECTION("wrong version") {
        json bad = {{"jsonrpc", "1.0"}, {"method", "tools/list"}, {"id", 1}};
        auto parsed = mcplink::JsonRpcRequest::from_json(bad);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == mcplink::JsonError::Code::InvalidVersion);
    }

    SECTION("missing method") {
        json bad = {{"jsonrpc", "2.0"}, {"id", 1}};
        auto parsed = mcplink::JsonRpcRequest::from_json(bad);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == mcplink::JsonError::Code::MissingField);
    }

    SECTION("non-scalar id") {
        json bad = {{"jsonrpc", "2.0"}, {"method", "tools/list"}, {"id", json::array()}};
        auto parsed = mcplink::JsonRpcRequest::from_json(bad);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == mcplink::JsonError::Code::InvalidId);
    }

    SECTION("scalar params") {
        json bad = {{"jsonrpc", "2.0"}, {"method", "tools/list"}, {"id", 1}, {"params", 5}};
        auto parsed = mcplink::JsonRpcRequest::from_json(bad);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == mcplink::JsonError::Code::InvalidParams);
    }
}

TEST_CASE("JsonRpcNotification omits id and params when not provided", "[json-rpc][notification]") {
    mcplink::JsonRpcNotification notification{"notifications/initialized"};
    auto j = notification.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["method"] == "notifications/initialized");
    REQUIRE_FALSE(j.contains("id"));
    REQUIRE_FALSE(j.contains("params"));
}

TEST_CASE("extract_result separates results from errors", "[json-rpc][response]") {
    SECTION("result member") {
        json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", json::array()}}}};
        auto result = mcplink::extract_result(response);
        REQUIRE(result.has_value());
        REQUIRE(result->contains("tools"));
    }

    SECTION("neither result nor error yields null") {
        json response = {{"jsonrpc", "2.0"}, {"id", 1}};
        auto result = mcplink::extract_result(response);
        REQUIRE(result.has_value());
        REQUIRE(result->is_null());
    }

    SECTION("error member wins over result") {
        json response = {
            {"jsonrpc", "2.0"}, {"id", 1},
            {"result", json::object()},
            {"error", {{"code", -32601}, {"message", "Method not found"}, {"data", "tools/x"}}}
        };
        auto result = mcplink::extract_result(response);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == -32601);
        REQUIRE(result.error().message == "Method not found");
        REQUIRE(result.error().data == json("tools/x"));
    }

    SECTION("error without a message falls back to a generic one") {
        json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", 7}}}};
        auto result = mcplink::extract_result(response);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "rpc error");
    }

    SECTION("ids are not compared") {
        json response = {{"jsonrpc", "2.0"}, {"id", 99}, {"result", "late"}};
        auto result = mcplink::extract_result(response);
        REQUIRE(result.has_value());
        REQUIRE(*result == "late");
    }
}

TEST_CASE("Response builders mirror the request id", "[json-rpc][response]") {
    const auto id = mcplink::JsonRpcId::integer(3);

    auto ok = mcplink::make_result_response(id, {{"value", 1}});
    REQUIRE(ok["id"] == 3);
    REQUIRE(ok["result"]["value"] == 1);

    auto failed = mcplink::make_error_response(id, mcplink::RpcError{-32603, "boom", std::nullopt});
    REQUIRE(failed["id"] == 3);
    REQUIRE(failed["error"]["code"] == -32603);
    REQUIRE(failed["error"]["message"] == "boom");
    REQUIRE_FALSE(failed["error"].contains("data"));
}
