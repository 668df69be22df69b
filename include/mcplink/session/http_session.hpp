#pragma once

#include "mcplink/session/session.hpp"
#include "mcplink/transport/http_client.hpp"

#include <memory>
#include <string>

namespace mcplink {

// ═══════════════════════════════════════════════════════════════════════════
// HttpSession
// ═══════════════════════════════════════════════════════════════════════════
// One POST per message to a fixed URL. The header map is computed once at
// creation (defaults, caller headers, bearer token) and reused.

class HttpSession final : public ISession {
public:
    /// Validate the URL and take ownership of `client`. An unparsable or
    /// non-http(s) URL, or a null client, is a connection error.
    [[nodiscard]] static ClientResult<std::unique_ptr<HttpSession>> create(
        const HttpConfig& config,
        std::unique_ptr<IHttpClient> client
    );

    HttpSession(std::unique_ptr<IHttpClient> client, std::string url, HeaderMap headers);

    [[nodiscard]] ClientResult<Json> send(
        std::string_view method,
        Json params,
        std::chrono::milliseconds timeout
    ) override;

    [[nodiscard]] ClientResult<void> notify(
        std::string_view method,
        std::optional<Json> params,
        std::chrono::milliseconds timeout
    ) override;

    void teardown() noexcept override { closed_ = true; }
    [[nodiscard]] bool is_alive() override { return closed_ == false; }

    [[nodiscard]] std::string_view transport_name() const noexcept override { return "http"; }
    [[nodiscard]] std::int64_t last_request_id() const noexcept override { return next_id_; }

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const HeaderMap& headers() const noexcept { return headers_; }

private:
    [[nodiscard]] ClientResult<HttpClientResponse> post(const Json& message, std::chrono::milliseconds timeout);

    std::unique_ptr<IHttpClient> client_;
    std::string url_;
    HeaderMap headers_;
    std::int64_t next_id_{0};
    bool closed_{false};
};

}  // namespace mcplink
