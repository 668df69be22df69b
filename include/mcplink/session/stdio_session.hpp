#pragma once

#include "mcplink/session/session.hpp"
#include "mcplink/transport/process_transport.hpp"

#include <memory>
#include <string>

namespace mcplink {

// ═══════════════════════════════════════════════════════════════════════════
// StdioSession
// ═══════════════════════════════════════════════════════════════════════════
// Owns one child process. The child is killed exactly once: by teardown(),
// or by the destructor when teardown() was never called.

class StdioSession final : public ISession {
public:
    /// Resolve the launch command (login shell for bare names), apply env and
    /// cwd, spawn under `config.connect_timeout`. No handshake.
    [[nodiscard]] static ClientResult<std::unique_ptr<StdioSession>> spawn(const StdioConfig& config);

    explicit StdioSession(std::unique_ptr<ProcessTransport> transport);
    ~StdioSession() override;

    StdioSession(const StdioSession&) = delete;
    StdioSession& operator=(const StdioSession&) = delete;

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

    void teardown() noexcept override;
    [[nodiscard]] bool is_alive() override;

    [[nodiscard]] std::string_view transport_name() const noexcept override { return "stdio"; }
    [[nodiscard]] std::int64_t last_request_id() const noexcept override { return next_id_; }

    [[nodiscard]] pid_t pid() const;
    [[nodiscard]] std::string stderr_tail() const;

private:
    [[nodiscard]] ClientError describe_failure(const TransportError& error) const;

    std::unique_ptr<ProcessTransport> transport_;
    std::int64_t next_id_{0};
    bool torn_down_{false};
};

}  // namespace mcplink
