#include "LocalDeviceManager.hpp"

#include <utility>

#include "../Logging/LogConfig.hpp"

namespace BACN::Device {

LocalDeviceManager::LocalDeviceManager(Transport::ITransportFactory& factory)
    : factory_(factory) {}

LocalDeviceManager::~LocalDeviceManager() {
    Terminate();
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<std::shared_ptr<LocalDevice>> LocalDeviceManager::Install(const LocalDeviceConfig& config) {
    Transport::TransportParams params;
    params.deviceId = config.deviceId;
    params.broadcastAddress = config.broadcastAddress;
    params.localAddress = config.localAddress;

    auto transport = factory_.Create(params);
    if (!transport) {
        return BACN_ERROR_STATE("Transport factory returned no endpoint");
    }
    auto device = std::make_shared<LocalDevice>(config, std::move(transport));

    std::shared_ptr<LocalDevice> previous;
    {
        std::lock_guard<std::mutex> guard(lock_);
        previous = std::exchange(current_, device);
    }
    if (previous) {
        BACN_LOG_V2(Device, "Device %u replaced by %u (previous dropped)", previous->Id(), device->Id());
    }
    BACN_LOG_V1(Device, "Created device %u (%s:%u, bcast %s)", config.deviceId,
                config.localAddress, config.port, config.broadcastAddress);
    return device;
}

Result<std::shared_ptr<LocalDevice>> LocalDeviceManager::Create(const ConfigOverrides& overrides) {
    auto config = ResolveConfig(overrides);
    if (!config) {
        config.error().Log();
        return std::unexpected(config.error());
    }
    return Install(*config);
}

Result<void> LocalDeviceManager::Initialize() {
    auto device = TRY(RequireDevice());
    return device->Initialize();
}

void LocalDeviceManager::Terminate() {
    if (auto device = Current()) {
        device->Terminate();
    }
}

Result<void> LocalDeviceManager::Reset(const ConfigOverrides& overrides) {
    auto snapshot = TRY(Backup());
    return Restore(snapshot, overrides);
}

Result<void> LocalDeviceManager::Restore(const ConfigBackup& snapshot, const ConfigOverrides& overrides) {
    auto config = TRY_LOG(MergeConfig(snapshot.config, overrides));

    // Explicit overrides win over tunables read back from the old transport.
    DeviceTunables tunables = snapshot.tunables;
    tunables.retries = overrides.retries.value_or(tunables.retries);
    tunables.segTimeoutMs = overrides.segTimeoutMs.value_or(tunables.segTimeoutMs);
    tunables.segWindow = overrides.segWindow.value_or(tunables.segWindow);
    if (overrides.apduTimeoutMs || overrides.timeoutMs) {
        tunables.timeoutMs = config.apduTimeoutMs;
    }

    Terminate();
    auto device = TRY(Install(config));
    device->ApplyTunables(tunables);
    TRY(device->Initialize());

    for (const auto& record : snapshot.objects) {
        auto replayed = AddOrUpdateObject(record);
        if (!replayed) {
            BACN_LOG_WARNING(Device, "Reset: could not replay %s", ToString(record.identifier));
            return std::unexpected(replayed.error());
        }
    }
    BACN_LOG_V1(Device, "Device %u reset (%zu objects replayed)", config.deviceId, snapshot.objects.size());
    return {};
}

void LocalDeviceManager::ClearAll() {
    std::shared_ptr<LocalDevice> previous;
    {
        std::lock_guard<std::mutex> guard(lock_);
        previous = std::move(current_);
    }
    if (previous) {
        previous->Terminate();
        BACN_LOG_V1(Device, "Cleared device %u", previous->Id());
    }
}

// ============================================================================
// Queries
// ============================================================================

std::shared_ptr<LocalDevice> LocalDeviceManager::Current() const {
    std::lock_guard<std::mutex> guard(lock_);
    return current_;
}

Result<std::shared_ptr<LocalDevice>> LocalDeviceManager::RequireDevice() const {
    auto device = Current();
    if (!device) {
        return BACN_ERROR_NOT_INITIALIZED("No local device; call Create() first");
    }
    return device;
}

Result<std::shared_ptr<LocalDevice>> LocalDeviceManager::RequireInitialized() const {
    auto device = Current();
    if (!device || !device->IsInitialized()) {
        return BACN_ERROR_NOT_INITIALIZED("Local device is not initialized");
    }
    return device;
}

Result<LocalDeviceConfig> LocalDeviceManager::Config() const {
    auto device = TRY(RequireDevice());
    return device->Config();
}

bool LocalDeviceManager::IsInitialized() const {
    auto device = Current();
    return device && device->IsInitialized();
}

// ============================================================================
// Object table
// ============================================================================

Result<std::vector<ObjectRecord>> LocalDeviceManager::LocalObjects() const {
    auto device = TRY(RequireDevice());
    const auto self = DeviceObject(device->Id());
    std::vector<ObjectRecord> out;
    for (auto& record : device->Endpoint().GetLocalObjects()) {
        if (record.identifier != self) {
            out.push_back(std::move(record));
        }
    }
    return out;
}

Result<ObjectRecord> LocalDeviceManager::GetObject(const ObjectIdentifier& id) const {
    auto device = TRY(RequireDevice());
    return device->Endpoint().GetObject(id);
}

Result<ObjectRecord> LocalDeviceManager::AddOrUpdateObject(const ObjectRecord& record) {
    auto device = TRY(RequireDevice());
    auto& endpoint = device->Endpoint();

    if (!endpoint.GetObject(record.identifier)) {
        TRY(endpoint.AddObject(record));
        BACN_LOG_V3(Device, "Added %s", ToString(record.identifier));
    } else {
        for (const auto& [property, value] : record.properties) {
            if (IsIdentityProperty(property)) {
                continue;
            }
            TRY(endpoint.SetProperty(record.identifier, property, value));
        }
        BACN_LOG_V3(Device, "Updated %s (%zu properties)", ToString(record.identifier),
                    record.properties.size());
    }
    return endpoint.GetObject(record.identifier);
}

Result<void> LocalDeviceManager::RemoveObject(const ObjectIdentifier& id) {
    auto device = TRY(RequireDevice());
    return device->Endpoint().RemoveObject(id);
}

Result<void> LocalDeviceManager::RemoveAllObjects() {
    auto objects = TRY(LocalObjects());
    auto device = TRY(RequireDevice());
    for (const auto& record : objects) {
        TRY(device->Endpoint().RemoveObject(record.identifier));
    }
    return {};
}

// ============================================================================
// Persistence
// ============================================================================

Result<ConfigBackup> LocalDeviceManager::Backup() const {
    auto device = TRY(RequireDevice());
    ConfigBackup snapshot;
    snapshot.config = device->Config();
    snapshot.tunables = device->Tunables();
    snapshot.objects = TRY(LocalObjects());
    return snapshot;
}

} // namespace BACN::Device
