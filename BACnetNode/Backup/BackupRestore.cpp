#include "BackupRestore.hpp"

#include "../Logging/LogConfig.hpp"
#include "BackupCodec.hpp"

namespace BACN::Backup {

BackupRestore::BackupRestore(Device::LocalDeviceManager& node, Discovery::DiscoveryService& discovery,
                             BackupParams params)
    : node_(node), discovery_(discovery), params_(std::move(params)), store_(params_.file) {}

BackupRestore::~BackupRestore() {
    background_.Shutdown();
}

Result<Device::ConfigBackup> BackupRestore::Save() {
    auto snapshot = TRY_LOG(node_.Backup());
    TRY_LOG(store_.Write(Serialize(snapshot)));
    BACN_LOG_V1(Backup, "Saved device %u (%zu objects) to %s", snapshot.config.deviceId,
                snapshot.objects.size(), store_.Path().string());
    return snapshot;
}

Result<Device::ConfigBackup> BackupRestore::Load(const Device::ConfigOverrides& overrides) {
    auto text = store_.Read();
    if (!text) {
        if (text.error().Is(NodeStatus::kNoBackup)) {
            BACN_LOG_V1(Backup, "No backup at %s", store_.Path().string());
        } else {
            text.error().Log();
        }
        return std::unexpected(text.error());
    }

    auto snapshot = Parse(*text);
    if (!snapshot) {
        BACN_LOG_ERROR(Backup, "Backup %s is corrupt", store_.Path().string());
        return std::unexpected(snapshot.error());
    }

    TRY_LOG(node_.Restore(*snapshot, overrides));
    BACN_LOG_V1(Backup, "Restored device %u (%zu objects) from %s", snapshot->config.deviceId,
                snapshot->objects.size(), store_.Path().string());
    return *snapshot;
}

Result<void> BackupRestore::Boot(const Device::ConfigOverrides& overrides) {
    auto loaded = Load(overrides);
    if (!loaded) {
        if (!loaded.error().Is(NodeStatus::kNoBackup)) {
            return std::unexpected(loaded.error());
        }
        TRY_LOG(node_.Create(overrides));
        TRY_LOG(node_.Initialize());
        BACN_LOG_V1(Node, "Booted fresh device (no backup)");
    }

    if (!params_.discoverOnBoot) {
        return {};
    }
    {
        std::lock_guard<std::mutex> guard(resultLock_);
        discoveryResult_.reset();
    }
    background_.DispatchAsync([this] {
        auto result = discovery_.DiscoverWithRetry();
        if (!result) {
            result.error().LogAsWarning();
        } else {
            BACN_LOG_V1(Node, "Boot discovery: %zu device(s) in %u attempt(s)",
                        result->devices.size(), result->attempts);
        }
        std::lock_guard<std::mutex> guard(resultLock_);
        discoveryResult_ = std::move(result);
    });
    return {};
}

std::optional<Result<Discovery::DiscoveryResult>> BackupRestore::WaitForDiscovery() {
    background_.Drain();
    std::lock_guard<std::mutex> guard(resultLock_);
    return discoveryResult_;
}

} // namespace BACN::Backup
