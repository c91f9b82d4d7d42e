#include "updatechecker/source_resolver.hpp"

#include <filesystem>
#include <regex>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace updatechecker {

using json = nlohmann::json;

std::optional<std::string> DirectUrlResolver::resolve(const Entry& entry) {
    return entry.url;
}

GithubReleaseResolver::GithubReleaseResolver(HttpClient& client, std::optional<std::string> token)
    : client_(client), token_(std::move(token)) {}

std::optional<std::string> GithubReleaseResolver::resolve(const Entry& entry) {
    if (!entry.git_asset) {
        spdlog::warn("Entry '{}' has no git asset pattern", entry.name);
        return std::nullopt;
    }

    spdlog::debug("Trying git package for git asset {}", *entry.git_asset);
    const auto package = validatePackage(entry.url);
    if (!package) {
        spdlog::warn("Url '{}' is not for a file and not a git package. Cannot proceed", entry.url);
        return std::nullopt;
    }

    const std::string releases_url = std::string(kApiBase) + "/repos/" + *package + "/releases";
    const auto releases = client_.readText(releases_url, apiHeaders());
    if (!releases) {
        spdlog::warn("GitHub API error for package '{}' {}", *package,
                     token_ ? "with token" : "without token");
        return std::nullopt;
    }

    auto url = selectAssetUrl(*releases, *entry.git_asset);
    if (!url) {
        spdlog::warn("No asset found for git asset {} in the latest release of {}. Cannot proceed",
                     *entry.git_asset, *package);
    }
    return url;
}

std::optional<std::string> GithubReleaseResolver::validatePackage(const std::string& reference) {
    const auto package = githubPackageFromReference(reference);
    if (!package) {
        spdlog::warn("Could not extract owner/repo from '{}'", reference);
        return std::nullopt;
    }

    const auto body = client_.readText(std::string(kApiBase) + "/repos/" + *package, apiHeaders());
    if (!body) {
        spdlog::warn("'{}' is not a valid GitHub repository", *package);
        return std::nullopt;
    }

    const json repo = json::parse(*body, nullptr, false);
    if (repo.is_discarded() || !repo.is_object()) {
        spdlog::warn("Unexpected GitHub API response for '{}'", *package);
        return std::nullopt;
    }
    const auto full_name = repo.find("full_name");
    if (full_name == repo.end() || !full_name->is_string()) {
        return package;
    }
    return full_name->get<std::string>();
}

std::optional<std::string> GithubReleaseResolver::selectAssetUrl(const std::string& releases_json,
                                                                 const std::string& asset_pattern) {
    const json releases = json::parse(releases_json, nullptr, false);
    if (releases.is_discarded() || !releases.is_array()) {
        spdlog::warn("Unexpected GitHub releases response");
        return std::nullopt;
    }
    if (releases.empty()) {
        spdlog::debug("No releases found");
        return std::nullopt;
    }

    const json& latest = releases.front();
    const auto assets = latest.find("assets");
    if (assets == latest.end() || !assets->is_array()) {
        spdlog::warn("Couldn't get asset url for '{}'", asset_pattern);
        return std::nullopt;
    }

    std::regex pattern;
    try {
        pattern = std::regex(asset_pattern);
    } catch (const std::regex_error& e) {
        spdlog::warn("Invalid asset pattern '{}': {}", asset_pattern, e.what());
        return std::nullopt;
    }

    for (const auto& asset : *assets) {
        const auto name = asset.find("name");
        const auto url = asset.find("browser_download_url");
        if (name == asset.end() || !name->is_string() || url == asset.end() || !url->is_string()) {
            continue;
        }
        const std::string asset_name = name->get<std::string>();
        std::smatch match;
        if (std::regex_search(asset_name, match, pattern, std::regex_constants::match_continuous)) {
            const std::string download_url = url->get<std::string>();
            spdlog::debug("Returning url for asset '{}': '{}'", asset_pattern, download_url);
            return download_url;
        }
    }

    spdlog::warn("No assets matching '{}' found in release", asset_pattern);
    return std::nullopt;
}

std::vector<Header> GithubReleaseResolver::apiHeaders() const {
    std::vector<Header> headers{{"Accept", "application/vnd.github+json"}};
    if (token_) {
        headers.push_back({"Authorization", "Bearer " + *token_});
    }
    return headers;
}

std::unique_ptr<SourceResolver> makeSourceResolver(const Entry& entry, HttpClient& client,
                                                   const std::optional<std::string>& token) {
    if (entry.git_asset) {
        return std::make_unique<GithubReleaseResolver>(client, token);
    }
    return std::make_unique<DirectUrlResolver>();
}

std::optional<std::string> githubPackageFromReference(const std::string& reference) {
    static const std::regex from_url{R"(github\.com/([^/\s]+/[^/?#\s]+))"};
    static const std::regex bare{R"(^[\w.\-]+/[\w.\-]+$)"};

    std::smatch match;
    if (std::regex_search(reference, match, from_url)) {
        std::string package = match[1].str();
        const std::string git_suffix = ".git";
        if (package.size() > git_suffix.size() &&
            package.compare(package.size() - git_suffix.size(), git_suffix.size(), git_suffix) == 0) {
            package.erase(package.size() - git_suffix.size());
        }
        return package;
    }
    if (reference.find("github") == std::string::npos && std::regex_match(reference, bare)) {
        return reference;
    }
    return std::nullopt;
}

std::optional<std::string> urlToFilename(const std::string& url) {
    const auto scheme = url.find("://");
    const std::size_t host_start = scheme == std::string::npos ? 0 : scheme + 3;
    const auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        spdlog::warn("Cannot get filename from url '{}'. No path", url);
        return std::nullopt;
    }

    const auto path_end = url.find_first_of("?#", path_start);
    const std::string path = url.substr(path_start, path_end == std::string::npos
                                                        ? std::string::npos
                                                        : path_end - path_start);
    const std::string base = path.substr(path.rfind('/') + 1);
    const std::string extension = std::filesystem::path{base}.extension().string();
    if (extension.size() < 2) {
        spdlog::warn("Cannot get filename from url '{}'. No dot in base '{}'", url, path);
        return std::nullopt;
    }
    return base;
}

} // namespace updatechecker
