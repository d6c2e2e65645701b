#include "BackupStore.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include "../Logging/LogConfig.hpp"

namespace BACN::Backup {

BackupStore::BackupStore(std::filesystem::path path)
    : path_(std::move(path)) {}

bool BackupStore::Exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}

Result<void> BackupStore::Write(const std::string& contents) {
    std::filesystem::path temp = path_;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            BACN_LOG_ERROR(Backup, "Cannot open %s for writing", temp.string());
            return BACN_ERROR_IO("Cannot open temporary backup file");
        }
        out << contents;
        out.flush();
        if (!out) {
            BACN_LOG_ERROR(Backup, "Short write to %s", temp.string());
            return BACN_ERROR_IO("Failed writing temporary backup file");
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        BACN_LOG_ERROR(Backup, "rename %s -> %s failed: %s", temp.string(), path_.string(), ec.message());
        std::filesystem::remove(temp, ec);
        return BACN_ERROR_IO("Cannot replace backup file");
    }
    BACN_LOG_V2(Backup, "Wrote %zu bytes to %s", contents.size(), path_.string());
    return {};
}

Result<std::string> BackupStore::Read() const {
    if (!Exists()) {
        return BACN_ERROR_NO_BACKUP("No backup file");
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        BACN_LOG_ERROR(Backup, "Cannot open %s", path_.string());
        return BACN_ERROR_IO("Cannot open backup file");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    BACN_LOG_V3(Backup, "Read %zu bytes from %s", buffer.str().size(), path_.string());
    return buffer.str();
}

Result<void> BackupStore::Remove() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return BACN_ERROR_IO("Cannot remove backup file");
    }
    return {};
}

} // namespace BACN::Backup
