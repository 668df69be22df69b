// ─────────────────────────────────────────────────────────────────────────────
// Process Transport Unit Tests
// ─────────────────────────────────────────────────────────────────────────────
// Tests for ProcessTransport edge cases and error handling.
// These tests use simple shell commands to test the transport layer
// without requiring external MCP servers.

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcplink/transport/process_transport.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include <signal.h>

using namespace mcplink;
using Json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

ProcessTransportConfig cat_config() {
    ProcessTransportConfig config;
    config.program = "/bin/cat";
    config.argv = {"/bin/cat"};
    return config;
}

ProcessTransportConfig sh_config(const std::string& script) {
    ProcessTransportConfig config;
    config.program = "/bin/sh";
    config.argv = {"/bin/sh", "-c", script};
    return config;
}

// Alive and not a zombie. An orphan's zombie lingers until init reaps it.
bool pid_exists(pid_t pid) {
    if (::kill(pid, 0) != 0) {
        return false;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    std::getline(stat, content);
    const auto paren = content.rfind(')');
    if (paren == std::string::npos || paren + 2 >= content.size()) {
        return true;
    }
    return content[paren + 2] != 'Z';
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic Lifecycle Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport starts and stops cleanly", "[process][lifecycle]") {
    ProcessTransport transport(cat_config());

    REQUIRE(transport.is_running() == false);

    auto result = transport.start();
    REQUIRE(result.has_value());
    REQUIRE(transport.is_running() == true);
    REQUIRE(transport.pid() > 0);

    transport.stop();
    REQUIRE(transport.is_running() == false);
}

TEST_CASE("ProcessTransport double start returns error", "[process][lifecycle]") {
    ProcessTransport transport(cat_config());

    auto result1 = transport.start();
    REQUIRE(result1.has_value());

    auto result2 = transport.start();
    REQUIRE(result2.has_value() == false);
    REQUIRE(result2.error().message.find("already running") != std::string::npos);

    transport.stop();
}

TEST_CASE("ProcessTransport double stop is safe", "[process][lifecycle]") {
    ProcessTransport transport(cat_config());
    REQUIRE(transport.start().has_value());

    transport.stop();
    REQUIRE(transport.is_running() == false);

    // Second stop should be a no-op
    transport.stop();
    REQUIRE(transport.is_running() == false);
}

TEST_CASE("ProcessTransport destructor kills the child", "[process][lifecycle]") {
    pid_t pid = -1;
    {
        ProcessTransport transport(cat_config());
        REQUIRE(transport.start().has_value());
        pid = transport.pid();
        REQUIRE(pid_exists(pid));
    }
    // Reaped by stop(), so the pid is gone (not even a zombie)
    REQUIRE(pid_exists(pid) == false);
}

TEST_CASE("ProcessTransport stop kills the whole process group", "[process][lifecycle]") {
    // The shell forks a long sleeper and reports its pid
    ProcessTransport transport(sh_config("sleep 30 & echo \"{\\\"child\\\": $!}\"; wait"));
    REQUIRE(transport.start().has_value());

    auto line = transport.receive(2s);
    REQUIRE(line.has_value());
    const auto grandchild = (*line)["child"].get<pid_t>();
    REQUIRE(pid_exists(grandchild));

    transport.stop();

    // The grandchild is reparented and reaped by init; give it a moment
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (pid_exists(grandchild) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    REQUIRE(pid_exists(grandchild) == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Spawn Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport reports a missing executable", "[process][spawn]") {
    ProcessTransportConfig config;
    config.program = "/nonexistent/mcp-server";
    config.argv = {config.program};

    ProcessTransport transport(config);
    auto result = transport.start();

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().category == TransportError::Category::Spawn);
    REQUIRE(result.error().message.find("spawn error: exec failed for /nonexistent/mcp-server") == 0);
    REQUIRE(transport.is_running() == false);
}

TEST_CASE("ProcessTransport reports a missing working directory", "[process][spawn]") {
    auto config = cat_config();
    config.working_directory = "/nonexistent/dir";

    ProcessTransport transport(config);
    auto result = transport.start();

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().category == TransportError::Category::Spawn);
    REQUIRE(result.error().message.find("chdir failed") != std::string::npos);
}

TEST_CASE("ProcessTransport rejects an empty program", "[process][spawn]") {
    ProcessTransport transport(ProcessTransportConfig{});
    auto result = transport.start();

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().message == "spawn error: empty program");
}

// ═══════════════════════════════════════════════════════════════════════════
// Message Exchange
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport round-trips newline-delimited JSON", "[process][io]") {
    ProcessTransport transport(cat_config());
    REQUIRE(transport.start().has_value());

    const Json message = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}};
    REQUIRE(transport.send(message, 1s).has_value());

    auto echoed = transport.receive(1s);
    REQUIRE(echoed.has_value());
    REQUIRE(*echoed == message);
}

TEST_CASE("ProcessTransport skips blank lines", "[process][io]") {
    ProcessTransport transport(sh_config("printf '\\n  \\r\\n{\"ok\":true}\\n'; sleep 5"));
    REQUIRE(transport.start().has_value());

    auto line = transport.receive(2s);
    REQUIRE(line.has_value());
    REQUIRE((*line)["ok"] == true);
}

TEST_CASE("ProcessTransport reports non-JSON output as a protocol error", "[process][io]") {
    ProcessTransport transport(sh_config("echo 'Starting server...'; sleep 5"));
    REQUIRE(transport.start().has_value());

    auto line = transport.receive(2s);
    REQUIRE(line.has_value() == false);
    REQUIRE(line.error().category == TransportError::Category::Protocol);
    REQUIRE(line.error().message.find("invalid JSON from process") == 0);
}

TEST_CASE("ProcessTransport read times out on a silent child", "[process][io][timeout]") {
    ProcessTransport transport(sh_config("sleep 30"));
    REQUIRE(transport.start().has_value());

    const auto started = std::chrono::steady_clock::now();
    auto line = transport.receive(200ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(line.has_value() == false);
    REQUIRE(line.error().category == TransportError::Category::Timeout);
    REQUIRE(line.error().message == "read timeout");
    REQUIRE(elapsed >= 200ms);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("ProcessTransport reports EOF when the child exits", "[process][io]") {
    ProcessTransport transport(sh_config("exit 0"));
    REQUIRE(transport.start().has_value());

    auto line = transport.receive(2s);
    REQUIRE(line.has_value() == false);
    REQUIRE(line.error().category == TransportError::Category::Network);
    REQUIRE(line.error().message == "Process closed connection");
}

TEST_CASE("ProcessTransport refuses to write to an exited child", "[process][io]") {
    ProcessTransport transport(sh_config("exit 4"));
    REQUIRE(transport.start().has_value());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (transport.is_process_alive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(transport.is_process_alive() == false);
    REQUIRE(transport.exit_code() == 4);

    auto sent = transport.send(Json{{"id", 1}}, 1s);
    REQUIRE(sent.has_value() == false);
    REQUIRE(sent.error().category == TransportError::Category::Network);
    REQUIRE(sent.error().message == "Process exited with code 4");
}

TEST_CASE("ProcessTransport enforces the maximum line length", "[process][io]") {
    auto config = sh_config("head -c 4096 /dev/zero | tr '\\0' 'a'; echo; sleep 5");
    config.max_line_length = 1024;

    ProcessTransport transport(config);
    REQUIRE(transport.start().has_value());

    auto line = transport.receive(2s);
    REQUIRE(line.has_value() == false);
    REQUIRE(line.error().category == TransportError::Category::Protocol);
    REQUIRE(line.error().message.find("maximum length") != std::string::npos);
}

TEST_CASE("ProcessTransport drops the rest of an oversized line", "[process][io]") {
    auto config = sh_config("head -c 4096 /dev/zero | tr '\\0' 'a'; sleep 0.3; echo 'aaaa'; echo '{\"next\":true}'; sleep 5");
    config.max_line_length = 1024;

    ProcessTransport transport(config);
    REQUIRE(transport.start().has_value());

    auto overflow = transport.receive(2s);
    REQUIRE(overflow.has_value() == false);
    REQUIRE(overflow.error().category == TransportError::Category::Protocol);

    auto line = transport.receive(2s);
    REQUIRE(line.has_value());
    REQUIRE((*line)["next"] == true);
}

TEST_CASE("ProcessTransport resumes a line interrupted by a read timeout", "[process][io][timeout]") {
    auto config = sh_config("printf '{\"part\":'; sleep 0.4; printf '\"whole\"}\\n'; sleep 5");

    ProcessTransport transport(config);
    REQUIRE(transport.start().has_value());

    auto early = transport.receive(100ms);
    REQUIRE(early.has_value() == false);
    REQUIRE(early.error().category == TransportError::Category::Timeout);

    auto line = transport.receive(2s);
    REQUIRE(line.has_value());
    REQUIRE((*line)["part"] == "whole");
}

// ═══════════════════════════════════════════════════════════════════════════
// Environment, Working Directory, Stderr
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport layers env overrides on the parent environment", "[process][env]") {
    ::setenv("MCPLINK_TEST_INHERITED", "from-parent", 1);

    auto config = sh_config("printf '{\"a\":\"%s\",\"b\":\"%s\"}\\n' \"$MCPLINK_TEST_INHERITED\" \"$MCPLINK_TEST_OVERRIDE\"; sleep 5");
    config.with_env("MCPLINK_TEST_OVERRIDE", "from-config");

    ProcessTransport transport(config);
    REQUIRE(transport.start().has_value());

    auto line = transport.receive(2s);
    REQUIRE(line.has_value());
    REQUIRE((*line)["a"] == "from-parent");
    REQUIRE((*line)["b"] == "from-config");

    ::unsetenv("MCPLINK_TEST_INHERITED");
}

TEST_CASE("ProcessTransport runs the child in the configured directory", "[process][env]") {
    const auto dir = std::filesystem::temp_directory_path();

    auto config = sh_config("printf '{\"cwd\":\"%s\"}\\n' \"$(pwd -P)\"; sleep 5");
    config.working_directory = dir.string();

    ProcessTransport transport(config);
    REQUIRE(transport.start().has_value());

    auto line = transport.receive(2s);
    REQUIRE(line.has_value());
    REQUIRE((*line)["cwd"] == std::filesystem::canonical(dir).string());
}

TEST_CASE("ProcessTransport captures a bounded stderr tail", "[process][stderr]") {
    auto config = sh_config("i=0; while [ $i -lt 500 ]; do echo \"noise line $i\" >&2; i=$((i+1)); done; echo '{\"done\":true}'; sleep 5");
    config.stderr_tail_limit = 256;

    ProcessTransport transport(config);
    REQUIRE(transport.start().has_value());

    auto line = transport.receive(5s);
    REQUIRE(line.has_value());
    REQUIRE((*line)["done"] == true);

    // Give the drain thread a moment to catch up
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (transport.read_stderr().find("noise line 499") == std::string::npos &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }

    const auto tail = transport.read_stderr();
    REQUIRE(tail.size() <= 256);
    REQUIRE(tail.find("noise line 499") != std::string::npos);
    REQUIRE(tail.find("noise line 0\n") == std::string::npos);
}

TEST_CASE("ProcessTransport discards stderr when asked to", "[process][stderr]") {
    auto config = sh_config("echo 'hidden' >&2; echo '{}'; sleep 5");
    config.stderr_handling = StderrHandling::Discard;

    ProcessTransport transport(config);
    REQUIRE(transport.start().has_value());
    REQUIRE(transport.receive(2s).has_value());
    REQUIRE(transport.read_stderr().empty());
}
