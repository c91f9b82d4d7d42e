#include "updatechecker/process_manager.hpp"
#include "updatechecker/detail/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <signal.h>
#include <spdlog/spdlog.h>

namespace updatechecker {

namespace fs = std::filesystem;

namespace {

const fs::path kProcRoot{"/proc"};

std::optional<pid_t> parsePid(const std::string& name) {
    if (name.empty() || !std::all_of(name.begin(), name.end(), ::isdigit)) {
        return std::nullopt;
    }
    const auto value = detail::parseUnsigned(name);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<pid_t>(*value);
}

std::string readSmallFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {};
    }
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::vector<std::string> readCommandLine(const fs::path& proc_dir) {
    const std::string raw = readSmallFile(proc_dir / "cmdline");
    std::vector<std::string> args;
    std::string current;
    for (char c : raw) {
        if (c == '\0') {
            args.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        args.push_back(current);
    }
    return args;
}

bool samePath(const fs::path& lhs, const fs::path& rhs) {
    std::error_code ec;
    if (fs::equivalent(lhs, rhs, ec)) {
        return true;
    }
    return fs::weakly_canonical(lhs, ec) == fs::weakly_canonical(rhs, ec);
}

} // namespace

std::string normalizeCommandLineArgument(const std::string& argument) {
    std::string out = detail::toLower(argument);
    std::replace(out.begin(), out.end(), '\\', '/');
    const auto first = out.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = out.find_last_not_of('/');
    return out.substr(first, last - first + 1);
}

std::size_t ProcessManager::killMatching(const ProcessQuery& query) {
    std::size_t killed = 0;
    for (const auto& process : findProcesses(query)) {
        if (kill(process)) {
            ++killed;
        }
    }
    return killed;
}

std::vector<ProcessInfo> ProcfsProcessManager::findProcesses(const ProcessQuery& query) {
    std::vector<ProcessInfo> matches;
    std::error_code ec;
    fs::directory_iterator it(kProcRoot, ec);
    if (ec) {
        spdlog::warn("Cannot list processes: {}", ec.message());
        return matches;
    }

    const std::string wanted_cmdline =
        query.cmdline ? normalizeCommandLineArgument(*query.cmdline) : std::string{};

    for (const auto& dir : it) {
        const auto pid = parsePid(dir.path().filename().string());
        if (!pid) {
            continue;
        }

        ProcessInfo info;
        info.pid = *pid;
        info.name = detail::trim(readSmallFile(dir.path() / "comm"));

        std::error_code link_ec;
        const fs::path exe = fs::read_symlink(dir.path() / "exe", link_ec);
        if (!link_ec) {
            info.exe = exe.string();
        }

        if (query.name && detail::toLower(info.name) != detail::toLower(*query.name)) {
            continue;
        }
        if (query.exe_path) {
            if (info.exe.empty() || !samePath(info.exe, *query.exe_path)) {
                continue;
            }
        }
        if (query.cmdline) {
            const auto args = readCommandLine(dir.path());
            const bool found = std::any_of(args.begin(), args.end(), [&](const std::string& arg) {
                return normalizeCommandLineArgument(arg) == wanted_cmdline;
            });
            if (!found) {
                continue;
            }
        }
        matches.push_back(std::move(info));
    }
    return matches;
}

bool ProcfsProcessManager::kill(const ProcessInfo& process) {
    spdlog::warn("Killing process {} ({})", process.pid, process.name);
    if (::kill(process.pid, SIGKILL) != 0) {
        spdlog::warn("Failed to kill process {}: {}", process.pid, std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace updatechecker
