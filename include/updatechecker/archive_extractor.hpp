#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace updatechecker {

// True for names carrying a .zip, .7z or .rar marker.
[[nodiscard]] bool isArchiveName(const std::string& filename);

class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    // Existing items at the destination with the same top-level name are replaced.
    virtual bool extract(const std::filesystem::path& archive,
                         const std::filesystem::path& destination,
                         const std::optional<std::string>& password, bool flatten) = 0;
};

/*
 * libarchive-backed extractor.
 *
 * The archive is first unpacked into a staging directory next to the destination, then its
 * top-level items are moved over. With flatten set, a single top-level directory (and no
 * top-level files) is skipped and its children are moved instead.
 */
class LibArchiveExtractor final : public ArchiveExtractor {
public:
    bool extract(const std::filesystem::path& archive, const std::filesystem::path& destination,
                 const std::optional<std::string>& password, bool flatten) override;
};

} // namespace updatechecker
