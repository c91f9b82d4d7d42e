#pragma once

#include <filesystem>
#include <system_error>

namespace updatechecker {

// Rename-based file swaps around a target. Every call reports failure through its return value.
class FileReplacer {
public:
    virtual ~FileReplacer() = default;

    // Moves target aside to backup, deleting any older backup first.
    virtual std::error_code backup(const std::filesystem::path& target,
                                   const std::filesystem::path& backup) = 0;
    // Puts backup back at target, replacing whatever is there.
    virtual std::error_code restore(const std::filesystem::path& backup,
                                    const std::filesystem::path& target) = 0;
    virtual std::error_code moveIntoPlace(const std::filesystem::path& source,
                                          const std::filesystem::path& target) = 0;
};

class FilesystemReplacer final : public FileReplacer {
public:
    std::error_code backup(const std::filesystem::path& target,
                           const std::filesystem::path& backup) override;
    std::error_code restore(const std::filesystem::path& backup,
                            const std::filesystem::path& target) override;
    std::error_code moveIntoPlace(const std::filesystem::path& source,
                                  const std::filesystem::path& target) override;
};

// Errors a running program holding the file can cause.
[[nodiscard]] bool isLockError(const std::error_code& ec);

} // namespace updatechecker
