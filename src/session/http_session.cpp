#include "mcplink/session/http_session.hpp"
#include "mcplink/log/logger.hpp"

namespace mcplink {

ClientResult<std::unique_ptr<HttpSession>> HttpSession::create(
    const HttpConfig& config,
    std::unique_ptr<IHttpClient> client
) {
    if (parse_url(config.url).has_value() == false) {
        return tl::unexpected(ClientError::connection("invalid url: " + config.url));
    }
    if (!client) {
        return tl::unexpected(ClientError::connection("failed to create HTTP client"));
    }

    client->set_connect_timeout(config.connect_timeout);
    client->set_verify_ssl(config.verify_ssl);

    return std::make_unique<HttpSession>(
        std::move(client),
        config.url,
        build_request_headers(config.headers, config.auth_token));
}

HttpSession::HttpSession(std::unique_ptr<IHttpClient> client, std::string url, HeaderMap headers)
    : client_(std::move(client))
    , url_(std::move(url))
    , headers_(std::move(headers))
{}

ClientResult<HttpClientResponse> HttpSession::post(const Json& message, std::chrono::milliseconds timeout) {
    auto response = client_->post(url_, message.dump(), headers_, timeout);
    if (!response) {
        const auto& error = response.error();
        if (error.code == HttpClientError::Code::Timeout) {
            return tl::unexpected(ClientError::timeout(error.message));
        }
        return tl::unexpected(ClientError::connection(error.message));
    }

    if (response->is_success() == false) {
        get_logger().warn_fmt("mcp.send(http): http error status={} body_len={}",
            response->status_code, response->body.size());
        return tl::unexpected(ClientError::connection(
            "HTTP " + std::to_string(response->status_code) + ": " + response->body));
    }
    return std::move(*response);
}

ClientResult<Json> HttpSession::send(
    std::string_view method,
    Json params,
    std::chrono::milliseconds timeout
) {
    if (closed_) {
        return tl::unexpected(ClientError::not_connected("session closed"));
    }

    const std::int64_t id = ++next_id_;
    get_logger().debug_fmt("mcp.send(http): id={} method={} timeout_ms={} url={}",
        id, method, timeout.count(), url_);

    const JsonRpcRequest request(std::string(method), id, std::move(params));
    auto response = post(request.to_json(), timeout);
    if (!response) {
        return tl::unexpected(response.error());
    }

    Json document;
    try {
        document = Json::parse(response->body);
    } catch (const Json::parse_error&) {
        // The raw body is the most useful diagnostic the server gave us.
        return tl::unexpected(ClientError::protocol(response->body));
    }

    auto result = extract_result(document);
    if (!result) {
        get_logger().warn_fmt("mcp.send(http): rpc error - {}", result.error().message);
        return tl::unexpected(ClientError::from_rpc_error(result.error()));
    }
    return std::move(*result);
}

ClientResult<void> HttpSession::notify(
    std::string_view method,
    std::optional<Json> params,
    std::chrono::milliseconds timeout
) {
    if (closed_) {
        return tl::unexpected(ClientError::not_connected("session closed"));
    }

    get_logger().debug_fmt("mcp.notify(http): method={} timeout_ms={} url={}", method, timeout.count(), url_);
    const JsonRpcNotification notification(std::string(method), std::move(params));
    auto response = post(notification.to_json(), timeout);
    if (!response) {
        return tl::unexpected(response.error());
    }
    return {};
}

}  // namespace mcplink
