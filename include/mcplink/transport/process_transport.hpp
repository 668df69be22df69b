#pragma once

// Platform check - ProcessTransport requires POSIX APIs
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessTransport is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "mcplink/transport.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/types.h>  // For pid_t

namespace mcplink {

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

/// What happens to the child's stderr
enum class StderrHandling {
    Discard,     // /dev/null
    Passthrough, // inherit the parent's stderr
    Capture      // drained by a background thread: logged at debug level, tail kept
};

struct ProcessTransportConfig {
    std::string program;                      // exec'd verbatim (no PATH search)
    std::vector<std::string> argv;            // argv[0] included
    std::vector<std::pair<std::string, std::string>> env_overrides;  // applied on top of environ
    std::optional<std::string> working_directory;

    std::chrono::milliseconds spawn_timeout{5'000};
    std::size_t max_line_length{8u << 20};    // 8 MiB per JSON-RPC line
    StderrHandling stderr_handling{StderrHandling::Capture};
    std::size_t stderr_tail_limit{64u << 10}; // bytes of stderr kept for diagnostics

    ProcessTransportConfig& with_env(std::string name, std::string value) {
        env_overrides.emplace_back(std::move(name), std::move(value));
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Spawns a subprocess and exchanges newline-delimited JSON documents over its
// stdin/stdout. Every blocking step (spawn, write, read) takes a deadline.
//
// The child is placed in its own process group; stop() SIGKILLs the whole
// group and reaps the child. It never waits for a graceful exit.

class ProcessTransport {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProcessTransport(ProcessTransportConfig config);
    ~ProcessTransport();

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;
    ProcessTransport(ProcessTransport&&) = delete;
    ProcessTransport& operator=(ProcessTransport&&) = delete;

    /// Fork and exec. Fails with Category::Spawn when the program cannot be
    /// executed, the working directory cannot be entered, or exec does not
    /// complete within spawn_timeout.
    [[nodiscard]] TransportResult<void> start();

    /// Kill the process group, reap the child and close all pipes. Idempotent.
    void stop();

    [[nodiscard]] bool is_running() const;

    /// Non-blocking check whether the child is still alive (reaps it if not).
    [[nodiscard]] bool is_process_alive();

    /// Write `message` followed by '\n'.
    [[nodiscard]] TransportResult<void> send(const Json& message, std::chrono::milliseconds timeout);

    /// Read one non-blank line and parse it as JSON.
    [[nodiscard]] TransportResult<Json> receive(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<int> exit_code() const;
    [[nodiscard]] pid_t pid() const;

    /// Captured stderr tail (empty unless stderr_handling == Capture).
    [[nodiscard]] std::string read_stderr() const;

    /// Wait until the child's stderr reaches EOF, so the tail is complete
    /// after an exit. Returns at once when stderr is not captured; false on timeout.
    [[nodiscard]] bool wait_stderr_closed(std::chrono::milliseconds timeout) const;

private:
    [[nodiscard]] TransportResult<void> write_all(const std::string& data, Clock::time_point deadline);
    [[nodiscard]] TransportResult<std::string> read_line(Clock::time_point deadline);
    [[nodiscard]] TransportResult<std::size_t> fill_read_buffer(Clock::time_point deadline);
    [[nodiscard]] TransportResult<void> ensure_alive_locked();
    void reap_if_exited_locked();
    void stderr_reader_loop(int fd);

    ProcessTransportConfig config_;

    mutable std::mutex mutex_;
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    pid_t child_pid_{-1};
    bool running_{false};
    bool reaped_{false};
    std::optional<int> exit_code_;

    static constexpr std::size_t read_buffer_size = 8192;
    char read_buffer_[read_buffer_size];
    std::size_t read_buffer_pos_{0};
    std::size_t read_buffer_len_{0};
    // Bytes of a line not yet terminated; kept across read timeouts.
    std::string pending_line_;
    bool discarding_line_{false};

    int stderr_fd_{-1};
    std::thread stderr_thread_;
    std::atomic<bool> stderr_stop_{false};
    std::string stderr_tail_;
    bool stderr_closed_{true};
    mutable std::mutex stderr_mutex_;
    mutable std::condition_variable stderr_cv_;
};

}  // namespace mcplink
