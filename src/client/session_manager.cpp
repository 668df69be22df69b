#include "mcplink/client/session_manager.hpp"
#include "mcplink/log/logger.hpp"

namespace mcplink {

SessionManager::SessionManager(HttpClientFactory http_factory)
    : http_factory_(std::move(http_factory))
{}

SessionManager::~SessionManager() {
    evict_all();
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<void> SessionManager::ensure_stdio(std::int64_t id, const StdioConfig& config) {
    return ensure(id, TransportConfig{config});
}

ClientResult<void> SessionManager::ensure_http(std::int64_t id, const HttpConfig& config) {
    return ensure(id, TransportConfig{config});
}

ClientResult<void> SessionManager::ensure(std::int64_t id, const TransportConfig& config) {
    std::lock_guard lock(mutex_);

    if (auto it = sessions_.find(id); it != sessions_.end()) {
        if (it->second->is_alive()) {
            return {};
        }
        erase_locked(it, "process exited");
    }

    if (const auto* stdio = std::get_if<StdioConfig>(&config)) {
        if (stdio->command.find_first_not_of(" \t\r\n") == std::string::npos) {
            return tl::unexpected(ClientError::configuration("Command cannot be empty"));
        }
    }

    auto session = connect_session(config, http_factory_);
    if (!session) {
        get_logger().warn_fmt("mcp.manager: connect failed for id={}: {}", id, session.error().message);
        return tl::unexpected(session.error());
    }

    get_logger().info_fmt("mcp.manager: session ready id={} transport={}", id, (*session)->transport_name());
    sessions_.emplace(id, std::move(*session));
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Tools
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<std::vector<ToolDescriptor>> SessionManager::list_tools(
    std::int64_t id,
    std::chrono::milliseconds timeout
) {
    std::lock_guard lock(mutex_);

    auto session = live_session_locked(id);
    if (!session) {
        return tl::unexpected(session.error());
    }

    auto result = (*session)->send(kMethodToolsList, Json::object(), timeout);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return parse_tools(*result);
}

ClientResult<std::string> SessionManager::call_tool(
    std::int64_t id,
    std::string_view tool_name,
    Json arguments,
    std::chrono::milliseconds timeout
) {
    std::lock_guard lock(mutex_);

    auto session = live_session_locked(id);
    if (!session) {
        return tl::unexpected(session.error());
    }

    CallToolParams params;
    params.name = std::string(tool_name);
    if (arguments.is_null() == false) {
        params.arguments = std::move(arguments);
    }

    auto result = (*session)->send(kMethodToolsCall, params.to_json(), timeout);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return extract_text_content(*result);
}

// ─────────────────────────────────────────────────────────────────────────────
// Eviction
// ─────────────────────────────────────────────────────────────────────────────

bool SessionManager::evict(std::int64_t id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    erase_locked(it, "evicted");
    return true;
}

std::size_t SessionManager::evict_all() {
    std::lock_guard lock(mutex_);
    const std::size_t count = sessions_.size();
    for (auto& [id, session] : sessions_) {
        session->teardown();
    }
    sessions_.clear();
    if (count > 0) {
        get_logger().info_fmt("mcp.manager: evicted {} session(s)", count);
    }
    return count;
}

bool SessionManager::is_connected(std::int64_t id) const {
    std::lock_guard lock(mutex_);
    const auto it = sessions_.find(id);
    return it != sessions_.end() && it->second->is_alive();
}

std::size_t SessionManager::session_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

ClientResult<ISession*> SessionManager::live_session_locked(std::int64_t id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return tl::unexpected(ClientError::not_connected());
    }
    if (it->second->is_alive() == false) {
        erase_locked(it, "process exited");
        return tl::unexpected(ClientError::not_connected("not connected: session process exited"));
    }
    return it->second.get();
}

void SessionManager::erase_locked(SessionMap::iterator it, std::string_view reason) {
    get_logger().info_fmt("mcp.manager: dropping session id={} ({})", it->first, reason);
    it->second->teardown();
    sessions_.erase(it);
}

}  // namespace mcplink
