#pragma once

#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace updatechecker {

struct ProcessInfo {
    pid_t pid{0};
    std::string name;
    std::string exe;
};

// Every given criterion must match; unset criteria are not checked.
struct ProcessQuery {
    std::optional<std::string> name;
    std::optional<std::string> exe_path;
    std::optional<std::string> cmdline;
};

class ProcessManager {
public:
    virtual ~ProcessManager() = default;

    [[nodiscard]] virtual std::vector<ProcessInfo> findProcesses(const ProcessQuery& query) = 0;
    virtual bool kill(const ProcessInfo& process) = 0;

    // Kills every match and returns how many were signalled.
    std::size_t killMatching(const ProcessQuery& query);
};

// Scans /proc; processes that cannot be inspected are skipped.
class ProcfsProcessManager final : public ProcessManager {
public:
    [[nodiscard]] std::vector<ProcessInfo> findProcesses(const ProcessQuery& query) override;
    bool kill(const ProcessInfo& process) override;
};

// Lower-cased, backslashes turned into slashes, surrounding slashes removed.
[[nodiscard]] std::string normalizeCommandLineArgument(const std::string& argument);

} // namespace updatechecker
