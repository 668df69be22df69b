#ifndef MCPLINK_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define MCPLINK_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "mcplink/session/session.hpp"
#include "mcplink/transport/http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcplink::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Allows tests to:
// - Queue canned responses
// - Answer JSON-RPC requests dynamically
// - Simulate errors and timeouts
// - Inspect request history

struct RecordedRequest {
    std::string url;
    std::string body;
    HeaderMap headers;
    std::chrono::milliseconds timeout{0};

    [[nodiscard]] nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    [[nodiscard]] std::string method() const {
        return json().value("method", "");
    }
};

class MockHttpClient final : public IHttpClient {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup - Queue Responses
    // ─────────────────────────────────────────────────────────────────────────

    void queue_response(int status_code, const std::string& body, const HeaderMap& headers = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        resp.result = HttpClientResponse{status_code, headers, body};
        response_queue_.push_back(std::move(resp));
    }

    void queue_json_response(int status_code, const std::string& body) {
        queue_response(status_code, body, HeaderMap{{"Content-Type", "application/json"}});
    }

    // {"jsonrpc":"2.0","id":id,"result":result}
    void queue_result(std::int64_t id, const nlohmann::json& result) {
        queue_json_response(200, nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump());
    }

    // Empty 202, the usual answer to a notification
    void queue_accepted() {
        queue_response(202, "");
    }

    void queue_error(HttpClientError::Code code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        resp.error = HttpClientError{code, message};
        response_queue_.push_back(std::move(resp));
    }

    void queue_connection_error(const std::string& message = "Connection refused") {
        queue_error(HttpClientError::Code::ConnectionFailed, message);
    }

    void queue_timeout(const std::string& message = "Request timed out") {
        queue_error(HttpClientError::Code::Timeout, message);
    }

    // Set a response handler for dynamic responses (takes precedence over the queue)
    using ResponseHandler = std::function<HttpClientResult<HttpClientResponse>(const RecordedRequest& request)>;

    void set_response_handler(ResponseHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        response_handler_ = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification - Check Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] std::optional<RecordedRequest> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::nullopt;
        }
        return requests_.back();
    }

    // JSON-RPC methods in request order
    [[nodiscard]] std::vector<std::string> methods() const {
        std::vector<std::string> out;
        for (const auto& req : requests()) {
            out.push_back(req.method());
        }
        return out;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
        response_queue_.clear();
        response_handler_ = nullptr;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::chrono::milliseconds connect_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_timeout_;
    }

    [[nodiscard]] bool verify_ssl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verify_ssl_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const HeaderMap& headers,
        std::chrono::milliseconds timeout
    ) override {
        RecordedRequest req{url, body, headers, timeout};

        ResponseHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(req);
            handler = response_handler_;
        }
        if (handler) {
            return handler(req);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (response_queue_.empty()) {
            // Default: 200 OK with empty body
            return HttpClientResponse{200, {}, ""};
        }

        auto queued = std::move(response_queue_.front());
        response_queue_.pop_front();

        if (queued.error.has_value()) {
            return tl::unexpected(*queued.error);
        }
        return *queued.result;
    }

private:
    struct QueuedResponse {
        std::optional<HttpClientResponse> result;
        std::optional<HttpClientError> error;
    };

    mutable std::mutex mutex_;
    std::chrono::milliseconds connect_timeout_{0};
    bool verify_ssl_{true};

    std::vector<RecordedRequest> requests_;
    std::deque<QueuedResponse> response_queue_;
    ResponseHandler response_handler_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Sharing one mock across sessions
// ─────────────────────────────────────────────────────────────────────────────
// Sessions own their client, so factories hand out forwarders to a mock the
// test keeps.

class ForwardingHttpClient final : public IHttpClient {
public:
    explicit ForwardingHttpClient(std::shared_ptr<MockHttpClient> target)
        : target_(std::move(target))
    {}

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        target_->set_connect_timeout(timeout);
    }

    void set_verify_ssl(bool verify) override {
        target_->set_verify_ssl(verify);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const HeaderMap& headers,
        std::chrono::milliseconds timeout
    ) override {
        return target_->post(url, body, headers, timeout);
    }

private:
    std::shared_ptr<MockHttpClient> target_;
};

inline HttpClientFactory share_mock(std::shared_ptr<MockHttpClient> mock) {
    return [mock]() -> std::unique_ptr<IHttpClient> {
        return std::make_unique<ForwardingHttpClient>(mock);
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// A minimal MCP server behind the mock
// ─────────────────────────────────────────────────────────────────────────────
// initialize -> serverInfo, notifications -> 202, tools/list -> `tools`,
// tools/call -> echo of arguments.text. Anything else is a JSON-RPC error.

inline MockHttpClient::ResponseHandler mcp_server_handler(nlohmann::json tools) {
    return [tools](const RecordedRequest& req) -> HttpClientResult<HttpClientResponse> {
        const auto request = req.json();
        if (request.contains("id") == false) {
            return HttpClientResponse{202, {}, ""};
        }
        const std::string method = request.value("method", "");
        nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", request["id"]}};
        if (method == "initialize") {
            response["result"] = {
                {"protocolVersion", "2024-11-05"},
                {"capabilities", nlohmann::json::object()},
                {"serverInfo", {{"name", "mock"}, {"version", "1.0"}}}
            };
        } else if (method == "tools/list") {
            response["result"] = {{"tools", tools}};
        } else if (method == "tools/call") {
            const auto& args = request["params"]["arguments"];
            response["result"] = {{"content", nlohmann::json::array({
                {{"type", "text"}, {"text", args.value("text", "")}}
            })}};
        } else {
            response["error"] = {{"code", -32601}, {"message", "Method not found"}};
        }
        return HttpClientResponse{200, {{"Content-Type", "application/json"}}, response.dump()};
    };
}

}  // namespace mcplink::testing

#endif  // MCPLINK_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
