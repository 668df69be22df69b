#pragma once

#include "mcplink/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// One POST per JSON-RPC message. The interface exists so sessions can be
// tested against a scripted client instead of a live endpoint.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /// Connection establishment limit; the whole request is still bounded by
    /// the per-call timeout passed to post().
    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    /// POST `body` to the absolute `url`. Headers are sent verbatim.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const HeaderMap& headers,
        std::chrono::milliseconds timeout
    ) = 0;
};

/// Creates the default (cpr) HTTP client.
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace mcplink
