#pragma once

#include <filesystem>
#include <string>

#include "../Core/Error.hpp"

namespace BACN::Backup {

inline constexpr const char* kDefaultBackupFile = "bacnode-backup.json";

// Single backup file, replaced atomically (temp file + rename) on every write.
class BackupStore {
public:
    explicit BackupStore(std::filesystem::path path = kDefaultBackupFile);

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }
    [[nodiscard]] bool Exists() const;

    Result<void> Write(const std::string& contents);

    /// NoBackup when the file does not exist.
    [[nodiscard]] Result<std::string> Read() const;

    Result<void> Remove();

private:
    std::filesystem::path path_;
};

} // namespace BACN::Backup
