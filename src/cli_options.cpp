#include "updatechecker/cli_options.hpp"
#include "updatechecker/config.hpp"
#include "updatechecker/detail/string_utils.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

#include <fmt/format.h>

namespace updatechecker {

namespace {

std::vector<std::string> splitNames(const std::string& text) {
    std::vector<std::string> names;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const auto end = comma == std::string::npos ? text.size() : comma;
        std::string name = detail::trim(std::string_view(text).substr(start, end - start));
        if (!name.empty()) {
            names.push_back(std::move(name));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return names;
}

} // namespace

CliOptions parseCommandLine(int argc, const char* const* argv) {
    CliOptions options;
    int arg_index = 1;

    const auto value = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw ConfigError(fmt::format("Option '{}' requires a value", option));
        }
        arg_index += 2;
        return argv[arg_index - 1];
    };

    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-c" || option == "--config") {
            options.config_path = std::filesystem::path{value(option)};
        } else if (option == "--async") {
            options.async = true;
            ++arg_index;
        } else if (option == "--no-async") {
            options.async = false;
            ++arg_index;
        } else if (option == "-t" || option == "--threads") {
            const std::string text = value(option);
            const auto threads = detail::parseUnsigned(text);
            if (!threads || *threads == 0) {
                throw ConfigError(fmt::format("Invalid thread count: {}", text));
            }
            options.threads = static_cast<std::size_t>(*threads);
        } else if (option == "-e" || option == "--entries") {
            const auto names = splitNames(value(option));
            options.entries.insert(options.entries.end(), names.begin(), names.end());
        } else if (option == "--force") {
            options.force = true;
            ++arg_index;
        } else if (option == "-v" || option == "--verbose") {
            options.verbose = true;
            ++arg_index;
        } else if (option == "--gh-token") {
            options.github_token = value(option);
        } else if (option == "-h" || option == "--help") {
            options.help = true;
            ++arg_index;
        } else {
            throw ConfigError(fmt::format("Unknown option '{}'", option));
        }
    }
    return options;
}

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name
              << " [-c <config>] [--async|--no-async] [-t <threads>] [-e <names>] [--force]"
                 " [-v] [--gh-token <token>]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -c, --config <path>   Configuration file (default: ./" << kConfigFilename
              << ", then ~/" << kConfigFilename << ")\n"
              << "  --async / --no-async  Process entries in parallel (default) or one by one\n"
              << "  -t, --threads <n>     Worker count (default: available cores - 1)\n"
              << "  -e, --entries <a,b>   Only process the named entries\n"
              << "  --force               Replace every target without checking for changes\n"
              << "  -v, --verbose         Debug logging\n"
              << "  --gh-token <token>    GitHub API token\n"
              << "  -h, --help            Show this message" << std::endl;
}

std::optional<std::string> resolveGithubToken(const std::optional<std::string>& from_cli,
                                              const std::optional<std::string>& from_config) {
    if (from_cli && !from_cli->empty()) {
        return from_cli;
    }
    if (from_config && !from_config->empty()) {
        return from_config;
    }
    const char* env = std::getenv("GITHUB_TOKEN");
    if (env && *env) {
        return std::string{env};
    }
    return std::nullopt;
}

} // namespace updatechecker
