#include "mcplink/session/session.hpp"
#include "mcplink/session/http_session.hpp"
#include "mcplink/session/stdio_session.hpp"
#include "mcplink/log/logger.hpp"

namespace mcplink {

ClientResult<std::unique_ptr<ISession>> open_session(
    const TransportConfig& config,
    const HttpClientFactory& http_factory
) {
    if (const auto* stdio = std::get_if<StdioConfig>(&config)) {
        auto session = StdioSession::spawn(*stdio);
        if (!session) {
            return tl::unexpected(session.error());
        }
        return std::unique_ptr<ISession>(std::move(*session));
    }

    const auto& http = std::get<HttpConfig>(config);
    auto client = http_factory ? http_factory() : make_http_client();
    auto session = HttpSession::create(http, std::move(client));
    if (!session) {
        return tl::unexpected(session.error());
    }
    return std::unique_ptr<ISession>(std::move(*session));
}

ClientResult<HandshakeResult> perform_handshake(ISession& session, std::chrono::milliseconds timeout) {
    auto init = session.send(kMethodInitialize, InitializeParams{}.to_json(), timeout);
    if (!init) {
        return tl::unexpected(init.error());
    }

    HandshakeResult result;
    result.server_info = std::move(*init);

    auto notified = session.notify(kNotificationInitialized, std::nullopt, timeout);
    if (!notified) {
        result.warning = "Failed to send initialized notification: " + notified.error().message;
        MCPLINK_LOG_WARN(*result.warning);
    }
    return result;
}

ClientResult<std::unique_ptr<ISession>> connect_session(
    const TransportConfig& config,
    const HttpClientFactory& http_factory
) {
    auto session = open_session(config, http_factory);
    if (!session) {
        return tl::unexpected(session.error());
    }

    auto handshake = perform_handshake(**session, connect_timeout_of(config));
    if (!handshake) {
        (*session)->teardown();
        return tl::unexpected(handshake.error());
    }
    return std::move(*session);
}

}  // namespace mcplink
