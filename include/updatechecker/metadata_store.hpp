#pragma once

#include "remote_descriptor.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace updatechecker {

/*
 * Sidecar persistence of remote identity headers, one JSON file per target:
 *
 *   { "url": ..., "etag": ..., "last_modified": ..., "content_length": ..., "cached_at": ... }
 *
 * Unknown keys are ignored and missing keys read as absent. A sidecar that cannot be parsed,
 * or whose target file no longer exists, loads as no metadata at all.
 */
class MetadataStore {
public:
    static constexpr const char* kSidecarSuffix = ".meta.json";

    [[nodiscard]] static std::filesystem::path sidecarPath(const std::filesystem::path& target);

    [[nodiscard]] std::optional<CachedMetadata> load(const std::filesystem::path& target) const;
    bool save(const std::filesystem::path& target, const RemoteDescriptor& descriptor,
              const std::string& url) const;
    // Absent sidecar counts as success.
    bool remove(const std::filesystem::path& target) const;
};

[[nodiscard]] std::string formatTimestamp(std::chrono::system_clock::time_point time);
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parseTimestamp(const std::string& text);

} // namespace updatechecker
