#pragma once

#include <mutex>
#include <optional>

#include "../Core/Scheduler.hpp"
#include "../Device/LocalDeviceManager.hpp"
#include "../Discovery/DiscoveryService.hpp"
#include "BackupStore.hpp"

namespace BACN::Backup {

struct BackupParams {
    std::filesystem::path file{kDefaultBackupFile};
    bool discoverOnBoot{true};
};

/**
 * @brief Persists the node configuration and rebuilds a device from it on boot.
 *
 * Boot() returns as soon as the local device is up; discovery runs on a
 * private Scheduler and can be joined with WaitForDiscovery().
 */
class BackupRestore {
public:
    BackupRestore(Device::LocalDeviceManager& node, Discovery::DiscoveryService& discovery,
                  BackupParams params = {});
    ~BackupRestore();

    BackupRestore(const BackupRestore&) = delete;
    BackupRestore& operator=(const BackupRestore&) = delete;

    /// Snapshot the current device and replace the backup file with it.
    Result<Device::ConfigBackup> Save();

    /// Read the backup (NoBackup / ParseError) and Restore() the node from it.
    Result<Device::ConfigBackup> Load(const Device::ConfigOverrides& overrides = {});

    /// Load(), or Create() + Initialize() when there is no backup, then discover in the background.
    Result<void> Boot(const Device::ConfigOverrides& overrides = {});

    /// Blocks until the background discovery started by Boot() finished.
    /// nullopt if Boot() never scheduled one.
    std::optional<Result<Discovery::DiscoveryResult>> WaitForDiscovery();

    [[nodiscard]] const BackupStore& Store() const noexcept { return store_; }

private:
    Device::LocalDeviceManager& node_;
    Discovery::DiscoveryService& discovery_;
    const BackupParams params_;
    BackupStore store_;

    std::mutex resultLock_;
    std::optional<Result<Discovery::DiscoveryResult>> discoveryResult_;

    // Declared last: joined before the members its work items touch go away.
    Core::Scheduler background_{"backup-boot"};
};

} // namespace BACN::Backup
