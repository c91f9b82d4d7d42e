#include "updatechecker/archive_extractor.hpp"
#include "updatechecker/detail/string_utils.hpp"

#include <memory>
#include <system_error>
#include <vector>

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace updatechecker {

namespace fs = std::filesystem;

namespace {

using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using ArchiveWriter = std::unique_ptr<struct archive, decltype(&archive_write_free)>;

constexpr std::size_t kReadBlockSize = 32768;

int copyData(struct archive* reader, struct archive* writer) {
    const void* buffer = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true) {
        const int r = archive_read_data_block(reader, &buffer, &size, &offset);
        if (r == ARCHIVE_EOF) {
            return ARCHIVE_OK;
        }
        if (r == ARCHIVE_RETRY) {
            continue;
        }
        if (r != ARCHIVE_OK) {
            spdlog::warn("Archive read error: {}", archive_error_string(reader));
            return r;
        }
        if (archive_write_data_block(writer, buffer, size, offset) < ARCHIVE_OK) {
            spdlog::warn("Archive write error: {}", archive_error_string(writer));
            return ARCHIVE_FATAL;
        }
    }
}

// Rejects absolute names and ".." components so nothing lands outside the staging dir.
bool isSafeEntryPath(const fs::path& path) {
    if (path.empty() || path.is_absolute()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

bool unpack(const fs::path& archive, const fs::path& staging,
            const std::optional<std::string>& password) {
    ArchiveReader reader(archive_read_new(), &archive_read_free);
    ArchiveWriter writer(archive_write_disk_new(), &archive_write_free);
    if (!reader || !writer) {
        spdlog::warn("Failed to allocate libarchive handles");
        return false;
    }

    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());
    if (password && !password->empty()) {
        archive_read_add_passphrase(reader.get(), password->c_str());
    }

    int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (geteuid() == 0) {
        flags |= ARCHIVE_EXTRACT_OWNER;
    }
    archive_write_disk_set_options(writer.get(), flags);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), archive.c_str(), kReadBlockSize) != ARCHIVE_OK) {
        spdlog::warn("Cannot open archive '{}': {}", archive.string(),
                     archive_error_string(reader.get()));
        return false;
    }

    bool ok = true;
    struct archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        const fs::path relative{archive_entry_pathname(entry)};
        if (!isSafeEntryPath(relative)) {
            spdlog::warn("Skipping unsafe archive member '{}'", relative.string());
            archive_read_data_skip(reader.get());
            continue;
        }
        const fs::path full = staging / relative;
        archive_entry_set_pathname(entry, full.c_str());

        if (const char* link = archive_entry_hardlink(entry)) {
            const fs::path link_target = staging / fs::path{link};
            archive_entry_set_hardlink(entry, link_target.c_str());
        }

        if (archive_write_header(writer.get(), entry) < ARCHIVE_OK) {
            spdlog::warn("Cannot write '{}': {}", relative.string(),
                         archive_error_string(writer.get()));
            ok = false;
            break;
        }
        if (archive_entry_size(entry) > 0 && copyData(reader.get(), writer.get()) != ARCHIVE_OK) {
            ok = false;
            break;
        }
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_OK) {
            spdlog::warn("Cannot finish '{}': {}", relative.string(),
                         archive_error_string(writer.get()));
            ok = false;
            break;
        }
    }
    if (ok && r != ARCHIVE_EOF) {
        spdlog::warn("Archive '{}' is damaged: {}", archive.string(),
                     archive_error_string(reader.get()));
        ok = false;
    }

    archive_read_close(reader.get());
    archive_write_close(writer.get());
    return ok;
}

fs::path contentRoot(const fs::path& staging, bool flatten) {
    if (!flatten) {
        return staging;
    }
    std::error_code ec;
    std::vector<fs::path> items;
    for (const auto& item : fs::directory_iterator(staging, ec)) {
        items.push_back(item.path());
    }
    if (items.size() == 1 && fs::is_directory(items.front(), ec)) {
        spdlog::debug("Flattening single top-level folder '{}'", items.front().filename().string());
        return items.front();
    }
    return staging;
}

bool moveItem(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (fs::exists(to, ec)) {
        fs::remove_all(to, ec);
        if (ec) {
            spdlog::warn("Cannot replace '{}': {}", to.string(), ec.message());
            return false;
        }
    }
    fs::rename(from, to, ec);
    if (!ec) {
        return true;
    }

    // Staging sits beside the destination, so this only triggers across mount points.
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::warn("Cannot move '{}' to '{}': {}", from.string(), to.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace

bool isArchiveName(const std::string& filename) {
    const std::string lowered = detail::toLower(filename);
    for (const char* marker : {".zip", ".7z", ".rar"}) {
        if (lowered.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool LibArchiveExtractor::extract(const fs::path& archive, const fs::path& destination,
                                  const std::optional<std::string>& password, bool flatten) {
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        spdlog::warn("Archive '{}' does not exist", archive.string());
        return false;
    }
    fs::create_directories(destination, ec);
    if (ec) {
        spdlog::warn("Cannot create '{}': {}", destination.string(), ec.message());
        return false;
    }

    const fs::path staging =
        destination / fmt::format(".{}.extract-{}", archive.filename().string(), ::getpid());
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        spdlog::warn("Cannot create staging directory '{}': {}", staging.string(), ec.message());
        return false;
    }

    spdlog::debug("Extracting '{}' to '{}'", archive.string(), destination.string());
    bool ok = unpack(archive, staging, password);
    if (ok) {
        const fs::path root = contentRoot(staging, flatten);
        std::vector<fs::path> items;
        for (const auto& item : fs::directory_iterator(root, ec)) {
            items.push_back(item.path());
        }
        if (ec) {
            spdlog::warn("Cannot list '{}': {}", root.string(), ec.message());
            ok = false;
        }
        for (const auto& item : items) {
            if (!ok) {
                break;
            }
            ok = moveItem(item, destination / item.filename());
        }
    }

    std::error_code cleanup;
    fs::remove_all(staging, cleanup);
    if (cleanup) {
        spdlog::debug("Could not remove staging directory '{}': {}", staging.string(),
                      cleanup.message());
    }

    if (ok) {
        spdlog::info("Extracted '{}' to '{}'", archive.filename().string(), destination.string());
    }
    return ok;
}

} // namespace updatechecker
