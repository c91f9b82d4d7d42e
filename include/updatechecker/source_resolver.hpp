#pragma once

#include "entry.hpp"
#include "http_client.hpp"

#include <memory>
#include <optional>
#include <string>

namespace updatechecker {

// Turns an entry into the concrete URL of the artifact to fetch.
class SourceResolver {
public:
    virtual ~SourceResolver() = default;

    [[nodiscard]] virtual std::optional<std::string> resolve(const Entry& entry) = 0;
};

class DirectUrlResolver final : public SourceResolver {
public:
    [[nodiscard]] std::optional<std::string> resolve(const Entry& entry) override;
};

/*
 * Resolves entry.url (a github.com URL or "owner/repo") plus the entry.git_asset pattern to the
 * download URL of the first matching asset of the newest release.
 */
class GithubReleaseResolver final : public SourceResolver {
public:
    static constexpr const char* kApiBase = "https://api.github.com";

    GithubReleaseResolver(HttpClient& client, std::optional<std::string> token);

    [[nodiscard]] std::optional<std::string> resolve(const Entry& entry) override;

    // Normalized "owner/repo" if the repository exists.
    [[nodiscard]] std::optional<std::string> validatePackage(const std::string& reference);

    // Pattern is matched from the start of the asset name.
    [[nodiscard]] static std::optional<std::string>
    selectAssetUrl(const std::string& releases_json, const std::string& asset_pattern);

private:
    [[nodiscard]] std::vector<Header> apiHeaders() const;

    HttpClient& client_;
    std::optional<std::string> token_;
};

[[nodiscard]] std::unique_ptr<SourceResolver>
makeSourceResolver(const Entry& entry, HttpClient& client, const std::optional<std::string>& token);

// "owner/repo" from a github.com URL, or the reference itself when it already has that shape.
[[nodiscard]] std::optional<std::string> githubPackageFromReference(const std::string& reference);

// Last path segment of a URL when it carries an extension.
[[nodiscard]] std::optional<std::string> urlToFilename(const std::string& url);

} // namespace updatechecker
