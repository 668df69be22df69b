#include "mcplink/client/mcp_service.hpp"
#include "mcplink/client/probe.hpp"
#include "mcplink/log/logger.hpp"

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/use_future.hpp>

#include <algorithm>
#include <type_traits>

namespace mcplink {

namespace {

template <typename T>
ServiceResult<T> to_service_result(ClientResult<T> result) {
    if (!result) {
        return tl::unexpected(std::move(result.error().message));
    }
    if constexpr (std::is_void_v<T>) {
        return {};
    } else {
        return std::move(*result);
    }
}

}  // namespace

McpService::McpService(McpServiceConfig config)
    : config_(std::move(config))
    , manager_(config_.http_factory)
    , pool_(std::max<std::size_t>(config_.worker_threads, 1))
{}

McpService::~McpService() {
    pool_.wait();
    manager_.evict_all();
}

std::future<CheckResult> McpService::check_configuration(TransportConfig config) {
    return asio::co_spawn(pool_,
        [this, config = std::move(config)]() -> asio::awaitable<CheckResult> {
            co_return check_server(config, config_.http_factory);
        },
        asio::use_future);
}

std::future<ServiceResult<void>> McpService::ensure_session(std::int64_t id, ServerConfigRow row) {
    return asio::co_spawn(pool_,
        [this, id, row = std::move(row)]() -> asio::awaitable<ServiceResult<void>> {
            co_return to_service_result(ensure_session_from_row(manager_, id, row));
        },
        asio::use_future);
}

std::future<ServiceResult<void>> McpService::ensure_session(std::int64_t id, TransportConfig config) {
    return asio::co_spawn(pool_,
        [this, id, config = std::move(config)]() -> asio::awaitable<ServiceResult<void>> {
            co_return to_service_result(manager_.ensure(id, config));
        },
        asio::use_future);
}

std::future<ServiceResult<std::vector<ToolDescriptor>>> McpService::list_tools(
    std::int64_t id,
    std::optional<std::chrono::milliseconds> timeout
) {
    const auto effective = timeout.value_or(config_.list_tools_timeout);
    return asio::co_spawn(pool_,
        [this, id, effective]() -> asio::awaitable<ServiceResult<std::vector<ToolDescriptor>>> {
            co_return to_service_result(manager_.list_tools(id, effective));
        },
        asio::use_future);
}

std::future<ServiceResult<std::string>> McpService::call_tool(
    std::int64_t id,
    std::string tool_name,
    Json arguments,
    std::optional<std::chrono::milliseconds> timeout
) {
    const auto effective = timeout.value_or(config_.tool_call_timeout);
    return asio::co_spawn(pool_,
        [this, id, effective, tool_name = std::move(tool_name), arguments = std::move(arguments)]()
            -> asio::awaitable<ServiceResult<std::string>> {
            co_return to_service_result(manager_.call_tool(id, tool_name, arguments, effective));
        },
        asio::use_future);
}

std::future<ServiceResult<std::vector<ToolDescriptor>>> McpService::list_tools_for_row(
    std::int64_t id,
    ServerConfigRow row,
    std::optional<std::chrono::milliseconds> timeout
) {
    const auto effective = timeout.value_or(config_.list_tools_timeout);
    return asio::co_spawn(pool_,
        [this, id, effective, row = std::move(row)]()
            -> asio::awaitable<ServiceResult<std::vector<ToolDescriptor>>> {
            auto ensured = ensure_session_from_row(manager_, id, row);
            if (!ensured) {
                co_return tl::unexpected(ensured.error().message);
            }
            co_return to_service_result(manager_.list_tools(id, effective));
        },
        asio::use_future);
}

std::future<ServiceResult<std::string>> McpService::call_tool_for_row(
    std::int64_t id,
    ServerConfigRow row,
    std::string tool_name,
    Json arguments,
    std::optional<std::chrono::milliseconds> timeout
) {
    const auto effective = timeout.value_or(config_.tool_call_timeout);
    return asio::co_spawn(pool_,
        [this, id, effective, row = std::move(row), tool_name = std::move(tool_name),
         arguments = std::move(arguments)]() -> asio::awaitable<ServiceResult<std::string>> {
            auto ensured = ensure_session_from_row(manager_, id, row);
            if (!ensured) {
                co_return tl::unexpected(ensured.error().message);
            }
            co_return to_service_result(manager_.call_tool(id, tool_name, arguments, effective));
        },
        asio::use_future);
}

}  // namespace mcplink
