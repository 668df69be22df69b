#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Shell Command Composition
// ═══════════════════════════════════════════════════════════════════════════
// Decides how a configured stdio server is launched.
//
// A command with a path separator is exec'd directly with its argument list.
// A bare program name ("npx", "uvx", "python3") is run through the user's
// login shell so PATH changes made by version managers in shell profiles are
// honored:
//
//     $SHELL -lc '<command>' '<arg1>' '<arg2>' ...
//
// Every token is single-quoted; an embedded ' becomes '\'' (close quote,
// escaped quote, reopen quote). Inside single quotes the shell performs no
// expansion at all, so no argument can inject shell syntax.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

inline constexpr const char* kFallbackShell = "/bin/sh";

/// True when `command` has no '/' and must be resolved through the shell.
[[nodiscard]] bool is_bare_command(std::string_view command) noexcept;

/// Wrap `arg` in single quotes, replacing each ' with '\''.
[[nodiscard]] std::string shell_escape(std::string_view arg);

/// shell_escape(command) followed by each escaped argument, space separated.
[[nodiscard]] std::string compose_shell_command(
    std::string_view command,
    const std::vector<std::string>& args
);

/// `shell_env` when it is non-empty, otherwise kFallbackShell.
[[nodiscard]] std::string resolve_login_shell(const std::optional<std::string>& shell_env);

/// Program and argv (argv[0] included) that will actually be exec'd.
struct LaunchSpec {
    std::string program;
    std::vector<std::string> argv;
    bool via_shell{false};
};

/// Build the launch spec for `command` + `args`. `shell_env` is the value of
/// $SHELL (passed in so callers and tests control it).
[[nodiscard]] LaunchSpec build_launch_spec(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::optional<std::string>& shell_env
);

/// Read $SHELL from the current environment.
[[nodiscard]] std::optional<std::string> current_shell_env();

}  // namespace mcplink
