// ─────────────────────────────────────────────────────────────────────────────
// mcplink-cli - MCP server check / list / call tool
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   # Probe a local server (default action)
//   mcplink-cli --command npx --arg -y --arg @modelcontextprotocol/server-everything
//
//   # List tools of a remote server
//   mcplink-cli --url https://example.com/mcp --auth secret --list-tools
//
//   # Call a tool through a persisted configuration row
//   mcplink-cli --row server.json --call echo --args '{"text":"hi"}'
//
// Exit code is 0 on success, 1 on any failure.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcplink/client/mcp_service.hpp"
#include "mcplink/log/spdlog_logger.hpp"
#include "mcplink/version.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace mcplink;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset  = "\033[0m";
    const char* bold   = "\033[1m";
    const char* dim    = "\033[2m";
    const char* red    = "\033[31m";
    const char* green  = "\033[32m";
    const char* yellow = "\033[33m";
    const char* cyan   = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_warning(const std::string& msg) {
    std::cerr << color::c(color::yellow) << "Warning: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_tools(const std::vector<ToolDescriptor>& tools) {
    print_header("Tools");
    if (tools.empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
        return;
    }
    for (const auto& tool : tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow)
                  << "• " << tool.name << color::c(color::reset);
        if (tool.description) {
            std::cout << "\n  " << color::c(color::dim) << *tool.description << color::c(color::reset);
        }
        std::cout << "\n\n";
    }
}

Json tools_to_json(const std::vector<ToolDescriptor>& tools) {
    Json output = Json::array();
    for (const auto& tool : tools) {
        output.push_back(tool.to_json());
    }
    return output;
}

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

// Split "Name: Value" or "NAME=VALUE" at the first separator.
std::pair<std::string, std::string> split_pair(const std::string& text, char separator) {
    const auto pos = text.find(separator);
    if (pos == std::string::npos) {
        return {text, ""};
    }
    std::string value = text.substr(pos + 1);
    const auto start = value.find_first_not_of(" \t");
    value = (start == std::string::npos) ? std::string{} : value.substr(start);
    return {text.substr(0, pos), value};
}

std::optional<Json> read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        print_error("Cannot open " + path);
        return std::nullopt;
    }
    try {
        return Json::parse(in);
    } catch (const Json::parse_error& e) {
        print_error("Invalid JSON in " + path + ": " + e.what());
        return std::nullopt;
    }
}

void configure_logging(bool verbose, const std::optional<std::string>& log_file) {
    const LogLevel level = verbose ? LogLevel::Debug : LogLevel::Warn;
    if (log_file.has_value()) {
        set_logger(make_spdlog_console_file_logger(*log_file, level));
    } else {
        set_logger(make_spdlog_console_logger(level));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_check(McpService& service, TransportConfig config, bool json_output) {
    const CheckResult result = service.check_configuration(std::move(config)).get();

    if (json_output) {
        std::cout << result.to_json().dump(2) << "\n";
        return result.ok ? 0 : 1;
    }

    if (result.ok == false) {
        print_error(result.error.value_or("check failed"));
        return 1;
    }
    if (result.warning) {
        print_warning(*result.warning);
    }
    print_success("Server OK - " + std::to_string(result.tools_count.value_or(0)) + " tool(s)");
    if (result.tools) {
        print_tools(*result.tools);
    }
    return 0;
}

int report_tools(const ServiceResult<std::vector<ToolDescriptor>>& tools, bool json_output) {
    if (!tools) {
        print_error(tools.error());
        return 1;
    }
    if (json_output) {
        std::cout << tools_to_json(*tools).dump(2) << "\n";
    } else {
        print_tools(*tools);
    }
    return 0;
}

int report_call(const ServiceResult<std::string>& text, bool json_output) {
    if (!text) {
        print_error(text.error());
        return 1;
    }
    if (json_output) {
        std::cout << Json{{"text", *text}}.dump(2) << "\n";
    } else {
        std::cout << *text << "\n";
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcplink-cli", "MCP server check / list / call tool");

    options.add_options()
        // Stdio transport
        ("c,command", "Server command (stdio transport)", cxxopts::value<std::string>())
        ("a,arg", "Argument for the server command (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("e,env", "Environment entry NAME=VALUE (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("cwd", "Working directory for the server", cxxopts::value<std::string>())

        // HTTP transport
        ("u,url", "MCP endpoint URL (HTTP transport)", cxxopts::value<std::string>())
        ("H,header", "HTTP header 'Name: Value' (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("auth", "Bearer token for the Authorization header", cxxopts::value<std::string>())

        // Persisted configuration row
        ("row", "Server configuration row (JSON file)", cxxopts::value<std::string>())
        ("id", "Session id used with --row", cxxopts::value<std::int64_t>()->default_value("1"))

        // Actions
        ("check", "Probe the server (default)")
        ("list-tools", "List available tools")
        ("call", "Call a tool by name", cxxopts::value<std::string>())
        ("args", "JSON arguments for --call", cxxopts::value<std::string>()->default_value("{}"))

        // Timeouts
        ("connect-timeout", "Connect timeout in ms", cxxopts::value<std::int64_t>()->default_value("5000"))
        ("list-timeout", "tools/list timeout in ms", cxxopts::value<std::int64_t>()->default_value("5000"))
        ("call-timeout", "tools/call timeout in ms", cxxopts::value<std::int64_t>()->default_value("20000"))

        // Output
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable debug logging")
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("version", "Print version")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n";
            std::cout << "    mcplink-cli -c npx -a -y -a @modelcontextprotocol/server-everything\n";
            std::cout << "    mcplink-cli -u https://example.com/mcp --auth secret --list-tools\n";
            std::cout << "    mcplink-cli --row server.json --call echo --args '{\"text\":\"hi\"}'\n";
            return 0;
        }
        if (result.count("version")) {
            std::cout << kLibraryName << " " << kLibraryVersion << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;
        configure_logging(
            result.count("verbose") > 0,
            result.count("log-file") ? std::optional<std::string>(result["log-file"].as<std::string>()) : std::nullopt);

        const auto connect_timeout = normalize_timeout(result["connect-timeout"].as<std::int64_t>(), kDefaultConnectTimeout);
        const auto list_timeout = normalize_timeout(result["list-timeout"].as<std::int64_t>(), kDefaultListToolsTimeout);
        const auto call_timeout = normalize_timeout(result["call-timeout"].as<std::int64_t>(), kDefaultToolCallTimeout);

        Json call_args = Json::object();
        if (result.count("call")) {
            try {
                call_args = Json::parse(result["args"].as<std::string>());
            } catch (const Json::parse_error& e) {
                print_error("Invalid JSON arguments: " + std::string(e.what()));
                return 1;
            }
        }

        McpService service(McpServiceConfig{}
            .with_worker_threads(1)
            .with_list_tools_timeout(list_timeout)
            .with_tool_call_timeout(call_timeout));

        const bool use_row = result.count("row") > 0;
        const bool use_http = result.count("url") > 0;
        const bool use_stdio = result.count("command") > 0;

        if ((use_row ? 1 : 0) + (use_http ? 1 : 0) + (use_stdio ? 1 : 0) != 1) {
            print_error("Specify exactly one of --command (stdio), --url (HTTP) or --row");
            return 1;
        }

        // ─────────────────────────────────────────────────────────────────────
        // Persisted row
        // ─────────────────────────────────────────────────────────────────────
        if (use_row) {
            const auto node = read_json_file(result["row"].as<std::string>());
            if (node.has_value() == false) {
                return 1;
            }
            auto row = ServerConfigRow::from_json(*node);
            if (!row) {
                print_error(row.error().message);
                return 1;
            }
            const auto id = result["id"].as<std::int64_t>();

            if (result.count("list-tools")) {
                return report_tools(service.list_tools_for_row(id, *row).get(), json_output);
            }
            if (result.count("call")) {
                return report_call(
                    service.call_tool_for_row(id, *row, result["call"].as<std::string>(), call_args).get(),
                    json_output);
            }
            auto config = transport_config_from_row(*row);
            if (!config) {
                print_error(config.error().message);
                return 1;
            }
            return cmd_check(service, std::move(*config), json_output);
        }

        // ─────────────────────────────────────────────────────────────────────
        // Raw parameters
        // ─────────────────────────────────────────────────────────────────────
        TransportConfig config;
        if (use_stdio) {
            StdioConfig stdio;
            stdio.command = result["command"].as<std::string>();
            if (result.count("arg")) {
                stdio.args = result["arg"].as<std::vector<std::string>>();
            }
            if (result.count("env")) {
                for (const auto& entry : result["env"].as<std::vector<std::string>>()) {
                    auto [name, value] = split_pair(entry, '=');
                    stdio.with_env(name, value);
                }
            }
            if (result.count("cwd")) {
                stdio.with_cwd(result["cwd"].as<std::string>());
            }
            stdio.with_connect_timeout(connect_timeout).with_list_tools_timeout(list_timeout);
            config = std::move(stdio);
        } else {
            HttpConfig http;
            http.url = result["url"].as<std::string>();
            if (result.count("header")) {
                for (const auto& header : result["header"].as<std::vector<std::string>>()) {
                    auto [name, value] = split_pair(header, ':');
                    http.with_header(name, value);
                }
            }
            if (result.count("auth")) {
                http.with_bearer_token(result["auth"].as<std::string>());
            }
            http.with_connect_timeout(connect_timeout).with_list_tools_timeout(list_timeout);
            config = std::move(http);
        }

        if (result.count("list-tools") == 0 && result.count("call") == 0) {
            return cmd_check(service, std::move(config), json_output);
        }

        constexpr std::int64_t kCliSessionId = 1;
        const auto ensured = service.ensure_session(kCliSessionId, std::move(config)).get();
        if (!ensured) {
            print_error(ensured.error());
            return 1;
        }
        if (result.count("list-tools")) {
            return report_tools(service.list_tools(kCliSessionId).get(), json_output);
        }
        return report_call(
            service.call_tool(kCliSessionId, result["call"].as<std::string>(), call_args).get(),
            json_output);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
