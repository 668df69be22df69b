#pragma once

#include "mcplink/client/client_error.hpp"
#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/session/session.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Session Manager
// ─────────────────────────────────────────────────────────────────────────────

/// Cache of initialized sessions keyed by an external id.
///
/// Per id:  absent ──ensure_*()──▶ connecting ──initialize ok──▶ ready
///                                     │
///                                     └── failure: nothing cached
///
/// One mutex covers the whole map and is held for the full duration of every
/// operation, I/O included. That serializes all MCP traffic process-wide, and
/// guarantees one connection per id and no interleaving on a stdio pipe.
///
/// ensure_*() is first-writer-wins: once an id is cached, later calls succeed
/// without looking at their configuration until the entry is evicted.
///
/// A stdio session whose child has exited is dropped on the next access:
/// ensure_*() reconnects, list_tools()/call_tool() report it as not connected.
class SessionManager {
public:
    explicit SessionManager(HttpClientFactory http_factory = make_http_client);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    /// Tears down every cached session.
    ~SessionManager();

    [[nodiscard]] ClientResult<void> ensure_stdio(std::int64_t id, const StdioConfig& config);
    [[nodiscard]] ClientResult<void> ensure_http(std::int64_t id, const HttpConfig& config);
    [[nodiscard]] ClientResult<void> ensure(std::int64_t id, const TransportConfig& config);

    [[nodiscard]] ClientResult<std::vector<ToolDescriptor>> list_tools(
        std::int64_t id,
        std::chrono::milliseconds timeout = kDefaultListToolsTimeout
    );

    /// tools/call, flattened to text (see extract_text_content).
    [[nodiscard]] ClientResult<std::string> call_tool(
        std::int64_t id,
        std::string_view tool_name,
        Json arguments,
        std::chrono::milliseconds timeout = kDefaultToolCallTimeout
    );

    /// Tear down and forget one session. False when nothing was cached.
    bool evict(std::int64_t id);

    /// Tear down and forget every session. Returns how many were removed.
    std::size_t evict_all();

    /// Cached and still alive.
    [[nodiscard]] bool is_connected(std::int64_t id) const;

    [[nodiscard]] std::size_t session_count() const;

private:
    using SessionMap = std::unordered_map<std::int64_t, std::unique_ptr<ISession>>;

    [[nodiscard]] ClientResult<ISession*> live_session_locked(std::int64_t id);
    void erase_locked(SessionMap::iterator it, std::string_view reason);

    HttpClientFactory http_factory_;
    mutable std::mutex mutex_;
    SessionMap sessions_;
};

}  // namespace mcplink
