#include "mcplink/session/stdio_session.hpp"
#include "mcplink/log/logger.hpp"
#include "mcplink/transport/shell_command.hpp"

#include <algorithm>

namespace mcplink {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kStderrSettleTime{200};

std::chrono::milliseconds remaining(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

std::string last_nonempty_line(const std::string& text) {
    std::size_t end = text.size();
    while (end > 0) {
        const auto newline = text.rfind('\n', end - 1);
        const std::size_t begin = (newline == std::string::npos) ? 0 : newline + 1;
        std::string line = text.substr(begin, end - begin);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        if (!line.empty()) {
            return line;
        }
        if (newline == std::string::npos) {
            break;
        }
        end = newline;
    }
    return {};
}

// Server-initiated messages carry `method`; responses never do.
bool is_server_message(const Json& message) {
    return message.is_object() && message.contains("method");
}

// A response to an earlier request that timed out before it was read.
bool is_stale_response(const Json& message, std::int64_t current_id) {
    if (message.is_object() == false) {
        return false;
    }
    const auto id_it = message.find("id");
    return id_it != message.end() && id_it->is_number_integer() &&
           id_it->get<std::int64_t>() < current_id;
}

}  // namespace

ClientResult<std::unique_ptr<StdioSession>> StdioSession::spawn(const StdioConfig& config) {
    auto launch = build_launch_spec(config.command, config.args, current_shell_env());

    ProcessTransportConfig transport_config;
    transport_config.program = launch.program;
    transport_config.argv = std::move(launch.argv);
    transport_config.spawn_timeout = config.connect_timeout;
    transport_config.env_overrides = string_entries(config.env);
    transport_config.working_directory = effective_cwd(config.cwd);
    if (config.cwd.has_value() && transport_config.working_directory.has_value() == false) {
        MCPLINK_LOG_DEBUG("mcp.spawn(stdio): ignoring blank cwd");
    }

    get_logger().debug_fmt(
        "mcp.spawn(stdio): command={} args={} via_shell={} env_entries={} timeout_ms={}",
        config.command, config.args.size(), launch.via_shell,
        transport_config.env_overrides.size(), config.connect_timeout.count());

    auto transport = std::make_unique<ProcessTransport>(std::move(transport_config));
    auto started = transport->start();
    if (!started) {
        return tl::unexpected(ClientError::connection(started.error().message));
    }
    return std::make_unique<StdioSession>(std::move(transport));
}

StdioSession::StdioSession(std::unique_ptr<ProcessTransport> transport)
    : transport_(std::move(transport))
{}

StdioSession::~StdioSession() {
    teardown();
}

ClientResult<Json> StdioSession::send(
    std::string_view method,
    Json params,
    std::chrono::milliseconds timeout
) {
    if (torn_down_) {
        return tl::unexpected(ClientError::not_connected("session closed"));
    }

    const std::int64_t id = ++next_id_;
    get_logger().debug_fmt("mcp.send(stdio): id={} method={} timeout_ms={}", id, method, timeout.count());

    // Write and read share one deadline.
    const auto deadline = Clock::now() + timeout;
    const JsonRpcRequest request(std::string(method), id, std::move(params));

    auto written = transport_->send(request.to_json(), timeout);
    if (!written) {
        return tl::unexpected(describe_failure(written.error()));
    }

    while (true) {
        auto response = transport_->receive(remaining(deadline));
        if (!response) {
            get_logger().warn_fmt("mcp.send(stdio): id={} method={} failed: {}", id, method, response.error().message);
            return tl::unexpected(describe_failure(response.error()));
        }
        if (is_server_message(*response)) {
            get_logger().debug_fmt("mcp.send(stdio): skipping server message {}", (*response)["method"].dump());
            continue;
        }
        if (is_stale_response(*response, id)) {
            get_logger().debug_fmt("mcp.send(stdio): skipping late response id={}", (*response)["id"].dump());
            continue;
        }

        auto result = extract_result(*response);
        if (!result) {
            get_logger().warn_fmt("mcp.send(stdio): rpc error code={} - {}", result.error().code, result.error().message);
            return tl::unexpected(ClientError::from_rpc_error(result.error()));
        }
        return std::move(*result);
    }
}

ClientResult<void> StdioSession::notify(
    std::string_view method,
    std::optional<Json> params,
    std::chrono::milliseconds timeout
) {
    if (torn_down_) {
        return tl::unexpected(ClientError::not_connected("session closed"));
    }

    get_logger().debug_fmt("mcp.notify(stdio): method={} timeout_ms={}", method, timeout.count());
    const JsonRpcNotification notification(std::string(method), std::move(params));
    auto written = transport_->send(notification.to_json(), timeout);
    if (!written) {
        return tl::unexpected(describe_failure(written.error()));
    }
    return {};
}

void StdioSession::teardown() noexcept {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;
    try {
        transport_->stop();
    } catch (const std::exception& e) {
        MCPLINK_LOG_WARN(std::string("mcp.teardown(stdio): ") + e.what());
    }
}

bool StdioSession::is_alive() {
    return torn_down_ == false && transport_->is_process_alive();
}

pid_t StdioSession::pid() const {
    return transport_->pid();
}

std::string StdioSession::stderr_tail() const {
    return transport_->read_stderr();
}

ClientError StdioSession::describe_failure(const TransportError& error) const {
    auto client_error = ClientError::from_transport(error);
    if (error.category == TransportError::Category::Network) {
        // A dying child's last words may still be in flight on stderr.
        (void)transport_->wait_stderr_closed(kStderrSettleTime);
        const auto hint = last_nonempty_line(transport_->read_stderr());
        if (hint.empty() == false) {
            client_error.message += " (stderr: " + hint + ")";
        }
    }
    return client_error;
}

}  // namespace mcplink
