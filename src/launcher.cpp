#include "updatechecker/launcher.hpp"

#include <cerrno>
#include <cstring>

#include <spawn.h>
#include <sys/wait.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace updatechecker {

std::string ShellLauncher::buildCommandLine(const std::string& command,
                                            const std::string& arguments) {
    std::string line = command;
    if (!arguments.empty()) {
        line += ' ';
        line += arguments;
    }
    line += " &";
    return line;
}

void ShellLauncher::launch(const std::string& command, const std::string& arguments) {
    if (command.empty()) {
        spdlog::warn("Nothing to launch");
        return;
    }

    std::string line = buildCommandLine(command, arguments);
    spdlog::info("Launching: {}", line);

    char shell[] = "/bin/sh";
    char flag[] = "-c";
    char* argv[] = {shell, flag, line.data(), nullptr};

    pid_t pid = 0;
    const int rc = posix_spawn(&pid, shell, nullptr, nullptr, argv, environ);
    if (rc != 0) {
        spdlog::warn("Failed to launch '{}': {}", command, std::strerror(rc));
        return;
    }

    // The shell backgrounds the program and exits at once.
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::debug("waitpid for launcher shell failed: {}", std::strerror(errno));
            break;
        }
    }
}

} // namespace updatechecker
