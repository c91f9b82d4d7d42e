#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace updatechecker {

struct CliOptions {
    std::optional<std::filesystem::path> config_path;
    bool async{true};
    std::optional<std::size_t> threads;
    std::vector<std::string> entries;
    bool force{false};
    bool verbose{false};
    std::optional<std::string> github_token;
    bool help{false};
};

// Throws ConfigError on unknown options, missing values or a bad thread count.
[[nodiscard]] CliOptions parseCommandLine(int argc, const char* const* argv);

void printUsage(const char* program_name);

// --gh-token, then the config file's github_token, then $GITHUB_TOKEN.
[[nodiscard]] std::optional<std::string>
resolveGithubToken(const std::optional<std::string>& from_cli,
                   const std::optional<std::string>& from_config);

} // namespace updatechecker
