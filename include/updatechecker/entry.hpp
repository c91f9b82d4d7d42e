#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace updatechecker {

// One configured remote source to local target synchronization unit.
struct Entry {
    std::string name;
    std::string url;
    std::filesystem::path target;

    // Remote file whose first token is the MD5 of the artifact.
    std::optional<std::string> md5_url;
    // Asset name pattern; when set, url names a GitHub repository.
    std::optional<std::string> git_asset;

    std::optional<std::filesystem::path> unzip_target;
    std::optional<std::string> archive_password;
    bool flatten{false};

    // Executable whose processes are killed when the target is locked.
    std::optional<std::string> kill_if_locked;
    bool relaunch{false};
    std::optional<std::string> launch_command;
    std::optional<std::string> arguments;

    // Unset lets the transfer engine decide.
    std::optional<bool> chunked_download;
    bool use_content_length_check{true};
    bool force{false};
};

// An entry name doubles as a directory name under the candidate root, so it must be a single
// relative path component.
[[nodiscard]] bool isValidEntryName(const std::string& name);

} // namespace updatechecker
