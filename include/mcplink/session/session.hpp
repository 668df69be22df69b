#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════════════
// A connected channel to one MCP server. Requests are strictly sequential:
// send() performs one write and one read (or one POST) before returning, so
// responses are correlated by position. Request ids start at 1 and are never
// reused within a session.

#include "mcplink/client/client_error.hpp"
#include "mcplink/session/transport_config.hpp"
#include "mcplink/transport/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcplink {

class ISession {
public:
    virtual ~ISession() = default;

    /// One JSON-RPC round trip. Returns the `result` member (null when the
    /// response has neither `result` nor `error`).
    [[nodiscard]] virtual ClientResult<Json> send(
        std::string_view method,
        Json params,
        std::chrono::milliseconds timeout
    ) = 0;

    /// Fire-and-forget notification (no id, no response read).
    [[nodiscard]] virtual ClientResult<void> notify(
        std::string_view method,
        std::optional<Json> params,
        std::chrono::milliseconds timeout
    ) = 0;

    /// Release the underlying resource. Stdio kills the child; HTTP is a no-op.
    /// Safe to call more than once.
    virtual void teardown() noexcept = 0;

    /// False once a stdio child has exited or the session was torn down.
    [[nodiscard]] virtual bool is_alive() = 0;

    /// "stdio" or "http"
    [[nodiscard]] virtual std::string_view transport_name() const noexcept = 0;

    /// Id of the most recent request, 0 before the first one.
    [[nodiscard]] virtual std::int64_t last_request_id() const noexcept = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;

/// Spawn (stdio) or build (HTTP) a session without talking to the server.
[[nodiscard]] ClientResult<std::unique_ptr<ISession>> open_session(
    const TransportConfig& config,
    const HttpClientFactory& http_factory = make_http_client
);

struct HandshakeResult {
    Json server_info;                  ///< `result` of initialize
    std::optional<std::string> warning; ///< set when notifications/initialized failed
};

/// initialize, then notifications/initialized, both under `timeout`.
/// Only a failed initialize is an error.
[[nodiscard]] ClientResult<HandshakeResult> perform_handshake(
    ISession& session,
    std::chrono::milliseconds timeout
);

/// open_session + perform_handshake. The session is torn down when the
/// handshake fails, so no half-initialized session ever escapes.
[[nodiscard]] ClientResult<std::unique_ptr<ISession>> connect_session(
    const TransportConfig& config,
    const HttpClientFactory& http_factory = make_http_client
);

}  // namespace mcplink
