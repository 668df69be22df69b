#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// McpService
// ═══════════════════════════════════════════════════════════════════════════
// Caller-facing boundary. Every operation is an asio coroutine co-spawned on a
// shared thread pool and handed back as a std::future; no thread is dedicated
// to a session. Structured errors end here: results carry plain strings.
//
// Usage:
//   mcplink::McpService service;
//   auto ready = service.ensure_session(7, row).get();
//   auto tools = service.list_tools(7).get();
//   auto text  = service.call_tool(7, "echo", {{"text", "hi"}}).get();

#include "mcplink/client/config_row.hpp"
#include "mcplink/client/session_manager.hpp"
#include "mcplink/protocol/mcp_types.hpp"

#include <asio/thread_pool.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace mcplink {

template <typename T>
using ServiceResult = tl::expected<T, std::string>;

struct McpServiceConfig {
    std::size_t worker_threads{4};
    std::chrono::milliseconds list_tools_timeout{kDefaultListToolsTimeout};
    std::chrono::milliseconds tool_call_timeout{kDefaultToolCallTimeout};
    HttpClientFactory http_factory{make_http_client};

    McpServiceConfig& with_worker_threads(std::size_t count) {
        worker_threads = count;
        return *this;
    }

    McpServiceConfig& with_list_tools_timeout(std::chrono::milliseconds timeout) {
        list_tools_timeout = timeout;
        return *this;
    }

    McpServiceConfig& with_tool_call_timeout(std::chrono::milliseconds timeout) {
        tool_call_timeout = timeout;
        return *this;
    }

    McpServiceConfig& with_http_client_factory(HttpClientFactory factory) {
        http_factory = std::move(factory);
        return *this;
    }
};

class McpService {
public:
    explicit McpService(McpServiceConfig config = {});

    /// Waits for in-flight operations, then tears down every session.
    ~McpService();

    McpService(const McpService&) = delete;
    McpService& operator=(const McpService&) = delete;

    /// Probe a configuration without caching anything.
    [[nodiscard]] std::future<CheckResult> check_configuration(TransportConfig config);

    /// Connect `id` from a persisted row unless it is already connected.
    [[nodiscard]] std::future<ServiceResult<void>> ensure_session(std::int64_t id, ServerConfigRow row);

    /// Same, from raw transport parameters.
    [[nodiscard]] std::future<ServiceResult<void>> ensure_session(std::int64_t id, TransportConfig config);

    [[nodiscard]] std::future<ServiceResult<std::vector<ToolDescriptor>>> list_tools(
        std::int64_t id,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    [[nodiscard]] std::future<ServiceResult<std::string>> call_tool(
        std::int64_t id,
        std::string tool_name,
        Json arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// ensure_session, then list_tools, as one task.
    [[nodiscard]] std::future<ServiceResult<std::vector<ToolDescriptor>>> list_tools_for_row(
        std::int64_t id,
        ServerConfigRow row,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// ensure_session, then call_tool, as one task.
    [[nodiscard]] std::future<ServiceResult<std::string>> call_tool_for_row(
        std::int64_t id,
        ServerConfigRow row,
        std::string tool_name,
        Json arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    [[nodiscard]] SessionManager& manager() noexcept { return manager_; }

private:
    McpServiceConfig config_;
    SessionManager manager_;
    asio::thread_pool pool_;
};

}  // namespace mcplink
