#include "updatechecker/config.hpp"
#include "updatechecker/detail/string_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <regex>
#include <set>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace updatechecker {

namespace fs = std::filesystem;

namespace {

const std::regex kVariablePattern{R"(\{\{(\w+)\}\})"};
const std::regex kEnvPattern{R"(%(\w+)%)"};

constexpr int kMaxResolvePasses = 10;

const std::set<std::string> kKnownEntryKeys = {
    "url",       "md5",           "target",         "git_asset",        "unzip_target",
    "relaunch",  "kill_if_locked", "launch",        "arguments",        "archive_password",
    "variables", "flatten",       "force",          "chunked_download", "use_content_length_check",
};

std::string replaceAll(const std::string& text, const std::regex& pattern,
                       const std::function<std::string(const std::string&)>& lookup) {
    std::string out;
    auto last = text.cbegin();
    for (std::sregex_iterator it(text.cbegin(), text.cend(), pattern), end; it != end; ++it) {
        const auto& match = *it;
        out.append(last, match[0].first);
        out += lookup(match[1].str());
        last = match[0].second;
    }
    out.append(last, text.cend());
    return out;
}

std::optional<std::string> optionalString(const YAML::Node& node, const std::string& entry,
                                          const char* key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    if (!value.IsScalar()) {
        throw ConfigError(fmt::format("Entry '{}': '{}' must be a string", entry, key));
    }
    return value.as<std::string>();
}

std::optional<bool> optionalBool(const YAML::Node& node, const std::string& entry,
                                 const char* key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    try {
        return value.as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigError(fmt::format("Entry '{}': '{}' must be a boolean", entry, key));
    }
}

VariableMap readVariableMap(const YAML::Node& node, const std::string& context) {
    VariableMap out;
    if (!node || node.IsNull()) {
        return out;
    }
    if (!node.IsMap()) {
        throw ConfigError(fmt::format("Variables in {} must be a dictionary", context));
    }
    for (const auto& item : node) {
        const auto key = item.first.as<std::string>();
        if (!item.second.IsScalar()) {
            throw ConfigError(fmt::format("Variable '{}' must have a string value", key));
        }
        out[key] = item.second.as<std::string>();
    }
    return out;
}

std::string resolveChained(std::string value, const VariableMap& variables,
                           const std::string& context) {
    for (int pass = 0; pass < kMaxResolvePasses; ++pass) {
        std::string next = substituteVariables(value, variables, context);
        if (next == value) {
            break;
        }
        value = std::move(next);
    }
    return value;
}

} // namespace

std::string expandEnvVariables(const std::string& text) {
    if (text.find('%') == std::string::npos) {
        return text;
    }
    return replaceAll(text, kEnvPattern, [](const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            throw ConfigError(
                fmt::format("Undefined environment variable: '{}' referenced in path", name));
        }
        return std::string{value};
    });
}

std::string substituteVariables(const std::string& text, const VariableMap& variables,
                                const std::string& context) {
    const std::string expanded = expandEnvVariables(text);
    if (expanded.find("{{") == std::string::npos) {
        return expanded;
    }
    return replaceAll(expanded, kVariablePattern, [&](const std::string& name) {
        const auto it = variables.find(name);
        if (it == variables.end()) {
            throw ConfigError(
                fmt::format("Undefined variable: '{}' referenced in {}", name, context));
        }
        return it->second;
    });
}

bool isValidUrl(const std::string& url) {
    static const std::regex pattern{R"(^[A-Za-z][A-Za-z0-9+.\-]*://[^/?#\s]+.*$)"};
    return std::regex_match(url, pattern);
}

fs::path defaultConfigPath() {
    std::error_code ec;
    const fs::path local = fs::current_path(ec) / kConfigFilename;
    if (!ec && fs::exists(local, ec)) {
        return local;
    }

    const char* home = std::getenv("USERPROFILE");
    if (!home) {
        home = std::getenv("HOME");
    }
    return fs::path{home ? home : "~"} / kConfigFilename;
}

Config::Config(YAML::Node root) : root_(std::move(root)) {
    if (!root_ || root_.IsNull()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    if (!root_.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }
    const YAML::Node& rootNode = root_;
    const YAML::Node entries = rootNode["entries"];
    if (entries && !entries.IsNull() && !entries.IsMap()) {
        throw ConfigError("'entries' must be a mapping of entry names to entries");
    }
}

Config Config::fromFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ConfigError(fmt::format("Config file '{}' not found", path.string()));
    }
    try {
        return Config(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Cannot parse '{}': {}", path.string(), e.what()));
    }
}

Config Config::fromString(const std::string& text) {
    try {
        return Config(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Cannot parse configuration: {}", e.what()));
    }
}

VariableMap Config::variables() const {
    const YAML::Node node = root_["variables"];
    VariableMap resolved;
    if (!node || node.IsNull()) {
        return resolved;
    }
    if (!node.IsMap()) {
        throw ConfigError("Variables must be a dictionary");
    }

    // Declaration order matters: a variable may reference the ones above it.
    for (const auto& item : node) {
        const auto key = item.first.as<std::string>();
        if (!item.second.IsScalar()) {
            throw ConfigError(fmt::format("Variable '{}' must have a string value", key));
        }
        const std::string value = expandEnvVariables(item.second.as<std::string>());
        resolved[key] = resolveChained(value, resolved, "variables");
    }
    return resolved;
}

std::optional<std::string> Config::githubToken() const {
    const YAML::Node node = root_["github_token"];
    if (!node || node.IsNull() || !node.IsScalar()) {
        return std::nullopt;
    }
    auto token = node.as<std::string>();
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

std::vector<Entry> Config::entries() const {
    std::vector<Entry> out;
    const YAML::Node node = root_["entries"];
    if (!node || node.IsNull()) {
        return out;
    }

    const VariableMap globals = variables();
    for (const auto& item : node) {
        const auto name = item.first.as<std::string>();
        if (!item.second.IsMap()) {
            throw ConfigError(fmt::format("Entry '{}' must be a mapping", name));
        }
        out.push_back(prepareEntry(name, item.second, globals));
    }
    return out;
}

Entry Config::prepareEntry(const std::string& name, const YAML::Node& node,
                           const VariableMap& globals) const {
    for (const auto& item : node) {
        const auto key = item.first.as<std::string>();
        if (kKnownEntryKeys.count(key) == 0) {
            spdlog::debug("Entry '{}': ignoring unknown key '{}'", name, key);
        }
    }

    if (!isValidEntryName(name)) {
        throw ConfigError(fmt::format(
            "Invalid entry name '{}': must be non-empty and contain no path separators", name));
    }

    const std::string context = fmt::format("entry '{}'", name);

    VariableMap local = readVariableMap(node["variables"], context);
    for (auto& item : local) {
        item.second = expandEnvVariables(item.second);
    }
    for (auto& item : local) {
        VariableMap scope = local;
        for (const auto& global : globals) {
            scope.emplace(global.first, global.second);
        }
        item.second = resolveChained(item.second, scope, context);
    }

    VariableMap merged = local;
    for (const auto& global : globals) {
        merged.emplace(global.first, global.second);
    }

    const auto substitute = [&](const std::optional<std::string>& value) {
        if (!value || value->empty()) {
            return value;
        }
        return std::optional<std::string>{substituteVariables(*value, merged, context)};
    };

    Entry entry;
    entry.name = name;

    const auto url = optionalString(node, name, "url");
    if (!url || url->empty()) {
        throw ConfigError(fmt::format("Entry '{}': 'url' is required", name));
    }
    if (!isValidUrl(*url)) {
        throw ConfigError(fmt::format("Entry '{}': invalid URL: {}", name, *url));
    }
    entry.url = *url;

    const auto target = substitute(optionalString(node, name, "target"));
    if (!target || target->empty()) {
        throw ConfigError(fmt::format("Entry '{}': 'target' is required", name));
    }
    entry.target = *target;

    entry.md5_url = optionalString(node, name, "md5");
    entry.git_asset = optionalString(node, name, "git_asset");
    entry.archive_password = optionalString(node, name, "archive_password");
    entry.launch_command = substitute(optionalString(node, name, "launch"));
    entry.arguments = substitute(optionalString(node, name, "arguments"));

    if (const auto unzip_target = substitute(optionalString(node, name, "unzip_target"))) {
        std::error_code ec;
        if (!fs::is_directory(*unzip_target, ec)) {
            throw ConfigError(fmt::format("Entry '{}': unzip_target '{}' must be an existing directory",
                                          name, *unzip_target));
        }
        entry.unzip_target = fs::path{*unzip_target};
    }

    if (const auto kill = optionalString(node, name, "kill_if_locked")) {
        const std::string lowered = detail::toLower(*kill);
        if (lowered == "true" || lowered == "yes" || lowered == "on") {
            throw ConfigError(
                fmt::format("Entry '{}': kill_if_locked must name an executable path", name));
        }
        if (!kill->empty() && lowered != "false" && lowered != "no" && lowered != "off") {
            entry.kill_if_locked = substitute(kill);
        }
    }

    entry.relaunch = optionalBool(node, name, "relaunch").value_or(false);
    entry.flatten = optionalBool(node, name, "flatten").value_or(false);
    entry.chunked_download = optionalBool(node, name, "chunked_download");
    entry.use_content_length_check =
        optionalBool(node, name, "use_content_length_check").value_or(true);
    entry.force = optionalBool(node, name, "force").value_or(false);

    return entry;
}

bool isValidEntryName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

std::vector<Entry> selectEntries(std::vector<Entry> entries, const std::vector<std::string>& names) {
    if (names.empty()) {
        return entries;
    }
    const std::set<std::string> wanted(names.begin(), names.end());
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const Entry& entry) { return wanted.count(entry.name) == 0; }),
                  entries.end());
    return entries;
}

} // namespace updatechecker
