#include "mcplink/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient Implementation
// ─────────────────────────────────────────────────────────────────────────────
// cpr (C++ Requests) over libcurl. Each post() is an independent blocking
// request; nothing is shared between calls besides the settings below.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const HeaderMap& headers,
        std::chrono::milliseconds timeout
    ) override {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : headers) {
            cpr_headers[name] = value;
        }

        // A connect phase longer than the whole request would never fire.
        const auto connect_timeout = std::min(connect_timeout_, timeout);

        auto response = cpr::Post(
            cpr::Url{url},
            cpr_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connect_timeout},
            cpr::Timeout{timeout},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

private:
    HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);
        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg.empty() ? "request timed out" : msg);

            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);

            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    std::chrono::milliseconds connect_timeout_{5000};
    bool verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace mcplink
