#include "updatechecker/file_replacer.hpp"

#include <spdlog/spdlog.h>

namespace updatechecker {

namespace fs = std::filesystem;

namespace {

// rename(), with copy + remove when source and target live on different filesystems.
std::error_code renameOrCopy(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec || ec != std::errc::cross_device_link) {
        return ec;
    }

    spdlog::debug("Cross-device rename detected; copying '{}' to '{}'", from.string(), to.string());
    ec.clear();
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return ec;
    }
    std::error_code del_ec;
    fs::remove(from, del_ec);
    if (del_ec) {
        spdlog::debug("Could not remove '{}' after copy: {}", from.string(), del_ec.message());
    }
    return {};
}

} // namespace

bool isLockError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
           ec == std::errc::device_or_resource_busy || ec == std::errc::text_file_busy;
}

std::error_code FilesystemReplacer::backup(const fs::path& target, const fs::path& backup) {
    std::error_code ec;
    fs::remove(backup, ec);
    if (ec) {
        return ec;
    }
    fs::rename(target, backup, ec);
    return ec;
}

std::error_code FilesystemReplacer::restore(const fs::path& backup, const fs::path& target) {
    std::error_code ec;
    if (fs::exists(target, ec)) {
        fs::remove_all(target, ec);
        if (ec) {
            return ec;
        }
    }
    fs::rename(backup, target, ec);
    return ec;
}

std::error_code FilesystemReplacer::moveIntoPlace(const fs::path& source, const fs::path& target) {
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return ec;
        }
    }
    return renameOrCopy(source, target);
}

} // namespace updatechecker
