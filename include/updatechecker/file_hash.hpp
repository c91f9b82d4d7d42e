#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace updatechecker {

// Lower-case hex MD5 of a file's contents; absent when the file cannot be read.
[[nodiscard]] std::optional<std::string> md5File(const std::filesystem::path& path);

// Lower-case hex MD5 of an in-memory buffer.
[[nodiscard]] std::string md5Hex(const std::string& data);

} // namespace updatechecker
