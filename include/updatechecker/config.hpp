#pragma once

#include "entry.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace updatechecker {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using VariableMap = std::map<std::string, std::string>;

constexpr const char* kConfigFilename = "updatechecker.yaml";

// Expands %NAME% from the environment; an undefined name throws ConfigError.
[[nodiscard]] std::string expandEnvVariables(const std::string& text);

// Expands %NAME% and then {{name}}; an undefined name throws ConfigError.
[[nodiscard]] std::string substituteVariables(const std::string& text,
                                              const VariableMap& variables,
                                              const std::string& context = "path");

// True for an absolute URL with a scheme and a host.
[[nodiscard]] bool isValidUrl(const std::string& url);

// ./updatechecker.yaml when present, otherwise the file in the user's home directory.
[[nodiscard]] std::filesystem::path defaultConfigPath();

/*
 * YAML configuration: optional github_token, a variables map and an entries map.
 * Entries come back with variables substituted and validated; any problem throws ConfigError.
 */
class Config {
public:
    [[nodiscard]] static Config fromFile(const std::filesystem::path& path);
    [[nodiscard]] static Config fromString(const std::string& text);

    [[nodiscard]] VariableMap variables() const;
    [[nodiscard]] std::optional<std::string> githubToken() const;
    [[nodiscard]] std::vector<Entry> entries() const;

private:
    explicit Config(YAML::Node root);

    [[nodiscard]] Entry prepareEntry(const std::string& name, const YAML::Node& node,
                                     const VariableMap& globals) const;

    YAML::Node root_;
};

// Keeps entries whose names are listed; an empty list keeps all.
[[nodiscard]] std::vector<Entry> selectEntries(std::vector<Entry> entries,
                                               const std::vector<std::string>& names);

} // namespace updatechecker
