#include "remote_shell.hpp"
#include <fmt/format.h>

std::expected<std::string, std::string> RemoteShell::run(const std::string& command) {
    auto result = execute(command);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitStatus != 0) {
        return std::unexpected(fmt::format("command failed with status {}, output: {}", result->exitStatus,
                                           result->errorOutput.empty() ? result->output : result->errorOutput));
    }
    return std::move(result->output);
}

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string shellPath(const std::string& path) {
    if (path == "~") {
        return "\"$HOME\"";
    }
    if (path.rfind("~/", 0) == 0) {
        return "\"$HOME\"/" + shellQuote(path.substr(2));
    }
    return shellQuote(path);
}
