#include "mcplink/transport/shell_command.hpp"

#include <cstdlib>

namespace mcplink {

bool is_bare_command(std::string_view command) noexcept {
    return command.find('/') == std::string_view::npos;
}

std::string shell_escape(std::string_view arg) {
    std::string out;
    out.reserve(arg.size() + 2);
    out.push_back('\'');
    for (const char c : arg) {
        if (c == '\'') {
            out.append("'\\''");
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string compose_shell_command(std::string_view command, const std::vector<std::string>& args) {
    std::string composed = shell_escape(command);
    for (const auto& arg : args) {
        composed.push_back(' ');
        composed += shell_escape(arg);
    }
    return composed;
}

std::string resolve_login_shell(const std::optional<std::string>& shell_env) {
    if (shell_env.has_value() && shell_env->empty() == false) {
        return *shell_env;
    }
    return kFallbackShell;
}

LaunchSpec build_launch_spec(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::optional<std::string>& shell_env
) {
    LaunchSpec spec;
    if (is_bare_command(command)) {
        spec.program = resolve_login_shell(shell_env);
        spec.argv = {spec.program, "-lc", compose_shell_command(command, args)};
        spec.via_shell = true;
        return spec;
    }

    spec.program = command;
    spec.argv.reserve(args.size() + 1);
    spec.argv.push_back(command);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    return spec;
}

std::optional<std::string> current_shell_env() {
    const char* value = std::getenv("SHELL");
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace mcplink
