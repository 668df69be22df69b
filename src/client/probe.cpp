#include "mcplink/client/probe.hpp"
#include "mcplink/log/logger.hpp"

#include <algorithm>
#include <cctype>

namespace mcplink {

namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

void log_attempt(const TransportConfig& config) {
    if (const auto* stdio = std::get_if<StdioConfig>(&config)) {
        get_logger().info_fmt(
            "mcp.check: stdio connect (cmd='{}', args_count={}, connect_timeout_ms={}, list_tools_timeout_ms={})",
            stdio->command, stdio->args.size(), stdio->connect_timeout.count(), stdio->list_tools_timeout.count());
    } else {
        const auto& http = std::get<HttpConfig>(config);
        get_logger().info_fmt(
            "mcp.check: http connect (url='{}', connect_timeout_ms={}, list_tools_timeout_ms={})",
            http.url, http.connect_timeout.count(), http.list_tools_timeout.count());
    }
}

}  // namespace

CheckResult check_server(const TransportConfig& config, const HttpClientFactory& http_factory) {
    const bool is_stdio = std::holds_alternative<StdioConfig>(config);

    if (is_stdio && is_blank(std::get<StdioConfig>(config).command)) {
        return CheckResult::failure("Command cannot be empty");
    }

    log_attempt(config);

    auto opened = open_session(config, http_factory);
    if (!opened) {
        MCPLINK_LOG_WARN("mcp.check: connect failed: " + opened.error().message);
        return CheckResult::failure(opened.error().message);
    }
    // The session (and with it any child process) dies with this scope.
    std::unique_ptr<ISession> session = std::move(*opened);

    auto handshake = perform_handshake(*session, connect_timeout_of(config));
    if (!handshake) {
        MCPLINK_LOG_WARN("mcp.check: initialize failed: " + handshake.error().message);
        session->teardown();
        return CheckResult::failure("Failed to send initialize: " + handshake.error().message);
    }

    auto listed = session->send(kMethodToolsList, Json::object(), list_tools_timeout_of(config));
    session->teardown();
    if (!listed) {
        get_logger().warn_fmt("mcp.check: {} tools/list failed: {}", session->transport_name(), listed.error().message);
        const std::string prefix = is_stdio ? "Failed to request tools/list: " : "Failed HTTP tools/list: ";
        return CheckResult::failure(prefix + listed.error().message);
    }

    auto result = CheckResult::success(parse_tools(*listed));
    result.warning = std::move(handshake->warning);
    get_logger().info_fmt("mcp.check: {} ok - tools_count={}", session->transport_name(), *result.tools_count);
    return result;
}

}  // namespace mcplink
